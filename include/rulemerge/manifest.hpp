#pragma once

#include <rulemerge/pipeline.hpp>

#include <string>
#include <vector>

namespace rulemerge {

/**
 * JSON build manifest: one object per category with its counts, output path
 * and the SHA-256 of the rendered document.
 *
 *   {"generator": "rulemerge", "version": "0.1.0",
 *    "generated_at": "...", "categories": [{"name": "reject", ...}]}
 */
std::string BuildManifest(const std::vector<CategoryReport>& reports,
                          const std::string& generated_at);

}  // namespace rulemerge
