#pragma once

#include <rulemerge/category.hpp>
#include <rulemerge/fetcher.hpp>
#include <rulemerge/metrics.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace rulemerge {

/** Pipeline-wide knobs. */
struct PipelineOptions {
  size_t fetch_concurrency = 4;     // Source fetches in flight per category
  size_t category_concurrency = 4;  // Categories processed in parallel

  // Timestamp written into every document of one run.
  // Empty = UTC time at the start of Run() / RunCategory().
  std::string generated_at;

  std::string homepage;  // Optional document header line

  // Observability hook (optional)
  std::shared_ptr<MetricsSink> metrics;
};

/** Per-stage counts of ProcessLines(). */
struct ProcessStats {
  size_t raw_lines = 0;
  size_t normalized = 0;    // Lines that canonicalized to a rule
  size_t excluded = 0;      // Rules removed by the allowlist
  size_t unique_rules = 0;  // Distinct canonical rules after filtering
  size_t allowlist_entries = 0;
};

/** Outcome of one category. */
struct CategoryReport {
  std::string name;
  std::string output_path;

  size_t sources_total = 0;
  size_t sources_failed = 0;
  ProcessStats stats;

  std::vector<std::string> entries;  // Final sorted domain entries
  std::string document;              // Rendered output

  bool skipped = false;  // No sources list and no manual rules
  bool written = false;
  std::string error;     // Set when the document could not be produced

  bool ok() const { return error.empty(); }
};

/**
 * Merge/filter/convert pipeline.
 *
 * For each category: fetch every source (failures contribute nothing),
 * append manual rules, canonicalize, drop allowlisted rules, dedup, project
 * to domain entries, dedup again, sort and write the document.
 *
 * Categories share no mutable state and run on up to category_concurrency
 * threads. The fetcher is not owned and must outlive the pipeline; it may be
 * null, in which case remote sources are skipped.
 */
class Pipeline {
 public:
  Pipeline(std::vector<CategoryDescriptor> categories,
           Fetcher* fetcher,
           PipelineOptions options = {});

  /** Process every category. Reports are in descriptor order. */
  std::vector<CategoryReport> Run();

  /** Process a single category, writing its document. Never throws. */
  CategoryReport RunCategory(const CategoryDescriptor& category);

  const std::vector<CategoryDescriptor>& categories() const { return categories_; }

  /**
   * The pure part of the pipeline: raw rule lines and raw exclude lines in,
   * final sorted domain entries out.
   */
  static std::vector<std::string> ProcessLines(
      const std::vector<std::string>& raw_lines,
      const std::vector<std::string>& exclude_lines,
      ProcessStats* stats = nullptr);

 private:
  CategoryReport RunCategoryAt(const CategoryDescriptor& category,
                               const std::string& generated_at);
  std::vector<std::string> CollectRawLines(const CategoryDescriptor& category,
                                           CategoryReport* report);

  std::vector<CategoryDescriptor> categories_;
  Fetcher* fetcher_;
  PipelineOptions options_;
};

}  // namespace rulemerge
