#include <grg/version.hpp>

#include <algorithm>
#include <cctype>

namespace grg {

static const char* const kPseudoPrefix = "v0.0.0-";

bool is_usable_tag(const std::string& tag) {
    return !tag.empty() && tag[0] == 'v';
}

std::string make_pseudo_version(const std::string& timestamp,
                                const std::string& short_hash) {
    return kPseudoPrefix + timestamp + "-" + short_hash;
}

bool is_commit_timestamp(const std::string& s) {
    return s.size() == 14 &&
           std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool is_short_hash(const std::string& s) {
    return s.size() == 12 &&
           std::all_of(s.begin(), s.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

} // namespace grg
