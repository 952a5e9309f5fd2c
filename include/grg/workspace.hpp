#pragma once

#include <grg/result.hpp>
#include <filesystem>
#include <string>

namespace grg {

// Ephemeral directory owned by one resolution attempt. Removed on
// release() or destruction, whichever comes first.
class TempWorkspace {
public:
    // Create a fresh, empty grg-XXXXXX directory under base_dir, or under
    // the system temp directory when base_dir is empty.
    static Result<TempWorkspace> acquire(const std::string& base_dir = "");

    TempWorkspace(TempWorkspace&& other) noexcept;
    TempWorkspace& operator=(TempWorkspace&& other) noexcept;
    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;
    ~TempWorkspace();

    // Best-effort recursive removal; failures are logged, never returned
    void release();

    const std::filesystem::path& root() const { return root_; }

    // Where the bare snapshot is cloned
    std::filesystem::path repo_dir() const { return root_ / "repo"; }

    bool active() const { return !root_.empty(); }

private:
    explicit TempWorkspace(std::filesystem::path root);

    std::filesystem::path root_;
};

} // namespace grg
