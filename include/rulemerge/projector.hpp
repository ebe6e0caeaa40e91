#pragma once

#include <rulemerge/rule.hpp>

#include <optional>
#include <string>
#include <vector>

namespace rulemerge {

/**
 * Map a canonical rule to its final domain-routing entry.
 *
 *   domain         -> "example.com"
 *   domain-suffix  -> "+.example.com" (any leftover +. / *. / . is dropped first)
 *   anything else  -> std::nullopt
 */
std::optional<std::string> Project(const NormalizedRule& rule);

/** Project every rule; the result is deduplicated and sorted byte-wise. */
std::vector<std::string> ProjectAll(const RuleSet& rules);

}  // namespace rulemerge
