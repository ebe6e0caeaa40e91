#pragma once

#include <string>
#include <vector>

namespace rulemerge {

/**
 * One independent rule class (reject, proxy, direct, ...).
 *
 * Paths may point at files that do not exist; the pipeline treats a missing
 * sources list, manual rule file or exclude list as empty input.
 */
struct CategoryDescriptor {
  std::string name;
  std::string sources_path;  // URLs, one per line
  std::string rules_path;    // Manually authored raw rule lines
  std::string exclude_path;  // Allowlist lines
  std::string output_path;   // Generated document

  /**
   * Conventional layout:
   *   <root>/<name>/sources.list, rules.txt, exclude.txt
   *   <output_dir>/final_<name>.yaml
   */
  static CategoryDescriptor FromRoot(const std::string& root,
                                     const std::string& output_dir,
                                     const std::string& name);
};

/**
 * Parse a sources list: trims each line, drops blanks and '#' comments.
 */
std::vector<std::string> ParseSourcesList(const std::vector<std::string>& lines);

}  // namespace rulemerge
