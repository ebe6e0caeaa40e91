#include <rulemerge/manifest.hpp>
#include <rulemerge/internal.hpp>
#include <rulemerge/version.hpp>

#include <json/json.h>

namespace rulemerge {

std::string BuildManifest(const std::vector<CategoryReport>& reports,
                          const std::string& generated_at) {
  Json::Value json;
  json["generator"] = "rulemerge";
  json["version"] = Version();
  json["generated_at"] = generated_at;

  Json::Value categories(Json::arrayValue);
  for (const auto& report : reports) {
    Json::Value c;
    c["name"] = report.name;
    c["output"] = report.output_path;
    c["skipped"] = report.skipped;
    c["written"] = report.written;
    c["entries"] = static_cast<Json::UInt64>(report.entries.size());
    c["sources_total"] = static_cast<Json::UInt64>(report.sources_total);
    c["sources_failed"] = static_cast<Json::UInt64>(report.sources_failed);
    c["raw_lines"] = static_cast<Json::UInt64>(report.stats.raw_lines);
    c["normalized"] = static_cast<Json::UInt64>(report.stats.normalized);
    c["excluded"] = static_cast<Json::UInt64>(report.stats.excluded);
    c["unique_rules"] = static_cast<Json::UInt64>(report.stats.unique_rules);
    if (!report.document.empty()) {
      c["sha256"] = internal::Sha256::HexDigest(report.document);
    }
    if (!report.ok()) {
      c["error"] = report.error;
    }
    categories.append(c);
  }
  json["categories"] = categories;

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  return Json::writeString(builder, json) + "\n";
}

}  // namespace rulemerge
