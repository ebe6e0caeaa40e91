#include <rulemerge/projector.hpp>

#include <set>
#include <string_view>
#include <utility>

namespace rulemerge {

namespace {

// Drops "+.", then "*.", then "." in turn, so "+.*.x.com" also ends as "x.com".
std::string_view StripAllSuffixPrefixes(std::string_view value) {
  for (std::string_view prefix : {"+.", "*.", "."}) {
    if (value.compare(0, prefix.size(), prefix) == 0) {
      value.remove_prefix(prefix.size());
    }
  }
  return value;
}

}  // namespace

std::optional<std::string> Project(const NormalizedRule& rule) {
  switch (rule.kind) {
    case RuleKind::kDomain:
      return rule.value;
    case RuleKind::kDomainSuffix: {
      auto bare = StripAllSuffixPrefixes(rule.value);
      if (bare.empty()) return std::nullopt;
      return "+." + std::string(bare);
    }
    case RuleKind::kDomainKeyword:
    case RuleKind::kIpCidr:
    case RuleKind::kIpCidr6:
    case RuleKind::kAsn:
      break;
  }
  return std::nullopt;
}

std::vector<std::string> ProjectAll(const RuleSet& rules) {
  std::set<std::string> entries;
  for (const auto& rule : rules) {
    if (auto entry = Project(rule)) {
      entries.insert(std::move(*entry));
    }
  }
  return std::vector<std::string>(entries.begin(), entries.end());
}

}  // namespace rulemerge
