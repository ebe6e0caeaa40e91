#pragma once

#include <string>
#include <vector>

namespace rulemerge {

/** Header fields of a generated rule document. */
struct DocumentHeader {
  std::string category;      // Upper-cased in the description line
  std::string generated_at;  // UTC ISO-8601
  std::string homepage;      // Optional; line omitted when empty
};

/**
 * Render a Clash rule-provider document (behavior: domain):
 *
 *   #########################################
 *   # Generator: rulemerge 0.1.0
 *   # Updated: 2026-10-19T08:00:00Z
 *   # Description: auto-generated Clash REJECT rules (behavior: domain).
 *   #########################################
 *   payload:
 *     - '+.example.com'
 *
 * Entries are written in the given order, each single-quoted.
 */
std::string RenderDocument(const DocumentHeader& header,
                           const std::vector<std::string>& entries);

}  // namespace rulemerge
