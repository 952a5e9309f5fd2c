#pragma once

#include <grg/version.hpp>

#include <string>

// Matches v0.0.0-<14 digits>-<12 lowercase hex>
inline bool is_pseudo_version(const std::string& s) {
    const std::string prefix = "v0.0.0-";
    if (s.size() != prefix.size() + 14 + 1 + 12) return false;
    if (s.compare(0, prefix.size(), prefix) != 0) return false;
    if (s[prefix.size() + 14] != '-') return false;
    return grg::is_commit_timestamp(s.substr(prefix.size(), 14)) &&
           grg::is_short_hash(s.substr(prefix.size() + 15));
}
