#include <rulemerge/allowlist.hpp>
#include <rulemerge/normalize.hpp>

namespace rulemerge {

Allowlist Allowlist::Build(const std::vector<std::string>& raw_lines) {
  Allowlist allowlist;
  for (const auto& line : raw_lines) {
    if (auto rule = NormalizeRule(line)) {
      allowlist.entries_.insert(rule->Serialize());
    }
  }
  return allowlist;
}

bool Allowlist::Contains(const NormalizedRule& rule) const {
  return entries_.count(rule.Serialize()) > 0;
}

std::vector<NormalizedRule> Allowlist::Filter(
    const std::vector<NormalizedRule>& rules) const {
  if (entries_.empty()) {
    return rules;
  }

  std::vector<NormalizedRule> kept;
  kept.reserve(rules.size());
  for (const auto& rule : rules) {
    if (!Contains(rule)) {
      kept.push_back(rule);
    }
  }
  return kept;
}

}  // namespace rulemerge
