#include <grg/workspace.hpp>
#include <grg/log.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace grg {

TempWorkspace::TempWorkspace(fs::path root)
    : root_(std::move(root)) {}

TempWorkspace::TempWorkspace(TempWorkspace&& other) noexcept
    : root_(std::move(other.root_)) {
    other.root_.clear();
}

TempWorkspace& TempWorkspace::operator=(TempWorkspace&& other) noexcept {
    if (this != &other) {
        release();
        root_ = std::move(other.root_);
        other.root_.clear();
    }
    return *this;
}

TempWorkspace::~TempWorkspace() {
    release();
}

Result<TempWorkspace> TempWorkspace::acquire(const std::string& base_dir) {
    fs::path base;
    if (base_dir.empty()) {
        std::error_code ec;
        base = fs::temp_directory_path(ec);
        if (ec) {
            return GrgError{GrgError::Workspace,
                "no temporary directory available: " + ec.message(),
                "set TMPDIR or [workspace] temp-dir"};
        }
    } else {
        base = base_dir;
    }

    std::string tmpl = (base / "grg-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        return GrgError{GrgError::Workspace,
            "cannot create temporary directory in " + base.string() + ": "
                + strerror(errno)};
    }

    fs::path root(buf.data());
    log::trace("acquired workspace %s", root.c_str());
    return Result<TempWorkspace>::ok(TempWorkspace(std::move(root)));
}

void TempWorkspace::release() {
    if (root_.empty()) return;

    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        log::warn("could not remove workspace %s: %s",
                  root_.c_str(), ec.message().c_str());
    } else {
        log::trace("released workspace %s", root_.c_str());
    }
    root_.clear();
}

} // namespace grg
