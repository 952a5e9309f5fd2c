#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

// RAII temp directory for tests
struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& prefix = "grg_test_") {
        static std::atomic<int> counter{0};
        path = std::filesystem::temp_directory_path() / (prefix + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content) {
        auto full = path / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }
};
