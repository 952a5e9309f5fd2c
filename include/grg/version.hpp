#pragma once

#include <string>

namespace grg {

struct ResolvedVersion {
    std::string text;        // e.g., "v1.3.0" or "v0.0.0-20240102030405-abcdef012345"
    bool is_pseudo = false;
};

// Only "v"-prefixed tags count as releases; the rest of the tag is not validated
bool is_usable_tag(const std::string& tag);

// v0.0.0-<timestamp>-<short_hash>
std::string make_pseudo_version(const std::string& timestamp,
                                const std::string& short_hash);

// Exactly 14 decimal digits (YYYYMMDDHHMMSS)
bool is_commit_timestamp(const std::string& s);

// Exactly 12 lowercase hex characters
bool is_short_hash(const std::string& s);

} // namespace grg
