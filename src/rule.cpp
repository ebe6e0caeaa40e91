#include <rulemerge/rule.hpp>

#include <array>
#include <cctype>
#include <utility>

namespace rulemerge {

namespace {

constexpr std::array<std::pair<RuleKind, std::string_view>, 6> kKindNames = {{
    {RuleKind::kDomain, "domain"},
    {RuleKind::kDomainSuffix, "domain-suffix"},
    {RuleKind::kDomainKeyword, "domain-keyword"},
    {RuleKind::kIpCidr, "ip-cidr"},
    {RuleKind::kIpCidr6, "ip-cidr6"},
    {RuleKind::kAsn, "ip-asn"},
}};

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

}  // namespace

std::string_view KindName(RuleKind kind) {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) return name;
  }
  return "unknown";
}

std::optional<RuleKind> ParseKind(std::string_view name) {
  for (const auto& [k, kind_name] : kKindNames) {
    if (EqualsIgnoreCase(name, kind_name)) return k;
  }
  return std::nullopt;
}

std::string NormalizedRule::Serialize() const {
  std::string out(KindName(kind));
  out += ',';
  out += value;
  return out;
}

RuleSet Dedup(const std::vector<NormalizedRule>& rules) {
  return RuleSet(rules.begin(), rules.end());
}

}  // namespace rulemerge
