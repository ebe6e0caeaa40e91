#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rulemerge {

/** Rule types understood by the canonicalizer. */
enum class RuleKind {
  kDomain,         // DOMAIN,example.com
  kDomainSuffix,   // DOMAIN-SUFFIX,example.com or +.example.com
  kDomainKeyword,  // DOMAIN-KEYWORD,ads (never survives canonicalization)
  kIpCidr,         // IP-CIDR,1.2.3.0/24
  kIpCidr6,        // IP-CIDR6,2001:db8::/32
  kAsn             // IP-ASN,13335
};

/** Lower-case wire name of a kind ("domain", "domain-suffix", ...). */
std::string_view KindName(RuleKind kind);

/** Inverse of KindName. Matching is case-insensitive. */
std::optional<RuleKind> ParseKind(std::string_view name);

/**
 * Canonical rule: the pipeline's internal representation of one source line.
 *
 * `value` is lower-cased and trimmed. For kDomainSuffix it carries no
 * leading "+.", "*." or "." once produced by NormalizeRule().
 */
struct NormalizedRule {
  RuleKind kind = RuleKind::kDomain;
  std::string value;

  /** "kind,value", the form used for allowlist matching and dedup. */
  std::string Serialize() const;

  bool operator==(const NormalizedRule& other) const {
    return kind == other.kind && value == other.value;
  }
  bool operator!=(const NormalizedRule& other) const { return !(*this == other); }
  bool operator<(const NormalizedRule& other) const {
    if (kind != other.kind) return kind < other.kind;
    return value < other.value;
  }
};

/** Ordered set of canonical rules. Equality is on the full kind,value pair. */
using RuleSet = std::set<NormalizedRule>;

/**
 * Collapse a rule sequence to a set.
 * Rules with the same value but different kinds are kept apart.
 */
RuleSet Dedup(const std::vector<NormalizedRule>& rules);

}  // namespace rulemerge
