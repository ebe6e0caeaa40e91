#pragma once

#include <rulemerge/rule.hpp>

#include <string>
#include <unordered_set>
#include <vector>

namespace rulemerge {

/**
 * Per-category exclusion set.
 *
 * Entries are exclude lines canonicalized with NormalizeRule() and kept in
 * their serialized "kind,value" form. A rule is excluded only on an exact,
 * whole-string match; there is no substring or suffix matching.
 */
class Allowlist {
 public:
  Allowlist() = default;

  /** Build from raw exclude lines in any supported source format. */
  static Allowlist Build(const std::vector<std::string>& raw_lines);

  bool Contains(const NormalizedRule& rule) const;

  /** Rules not present in the allowlist, in input order. */
  std::vector<NormalizedRule> Filter(const std::vector<NormalizedRule>& rules) const;

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

 private:
  std::unordered_set<std::string> entries_;
};

}  // namespace rulemerge
