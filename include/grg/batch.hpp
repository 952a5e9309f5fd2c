#pragma once

#include <grg/result.hpp>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace grg {

// Result for one identifier: the require line or the error that stopped it
struct Outcome {
    std::string identifier;
    Result<std::string> result;
};

using ResolveFn = std::function<Result<std::string>(const std::string&)>;

// Resolve each identifier in order; a failure never stops the batch
std::vector<Outcome> resolve_all(const std::vector<std::string>& identifiers,
                                 const ResolveFn& resolve);

// Blank line, then the error section (if any), then the require lines.
// Both sections keep input order.
void render_report(const std::vector<Outcome>& outcomes, std::ostream& out);

bool has_failures(const std::vector<Outcome>& outcomes);

} // namespace grg
