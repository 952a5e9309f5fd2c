#include <grg/batch.hpp>
#include <grg/log.hpp>

#include <algorithm>

namespace grg {

std::vector<Outcome> resolve_all(const std::vector<std::string>& identifiers,
                                 const ResolveFn& resolve) {
    std::vector<Outcome> outcomes;
    outcomes.reserve(identifiers.size());

    for (const auto& id : identifiers) {
        auto r = resolve(id);
        if (r.is_err()) {
            log::debug("%s failed: %s", id.c_str(), r.error().format().c_str());
        }
        outcomes.push_back(Outcome{id, std::move(r)});
    }
    return outcomes;
}

bool has_failures(const std::vector<Outcome>& outcomes) {
    return std::any_of(outcomes.begin(), outcomes.end(),
                       [](const Outcome& o) { return o.result.is_err(); });
}

void render_report(const std::vector<Outcome>& outcomes, std::ostream& out) {
    out << "\n";

    if (has_failures(outcomes)) {
        out << "The following errors were found:\n";
        for (const auto& o : outcomes) {
            if (o.result.is_err()) {
                out << "  " << o.identifier << ": " << o.result.error().message << "\n";
            }
        }
        out << "\n";
    }

    for (const auto& o : outcomes) {
        if (o.result.is_ok()) {
            out << o.result.value() << "\n";
        }
    }
}

} // namespace grg
