#include <rulemerge/pipeline.hpp>
#include <rulemerge/allowlist.hpp>
#include <rulemerge/document.hpp>
#include <rulemerge/internal.hpp>
#include <rulemerge/io.hpp>
#include <rulemerge/normalize.hpp>
#include <rulemerge/projector.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <iterator>

namespace rulemerge {

namespace {

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

void AppendLines(std::vector<std::string>* out, std::vector<std::string> lines) {
  out->insert(out->end(), std::make_move_iterator(lines.begin()),
              std::make_move_iterator(lines.end()));
}

}  // namespace

Pipeline::Pipeline(std::vector<CategoryDescriptor> categories,
                   Fetcher* fetcher,
                   PipelineOptions options)
    : categories_(std::move(categories)),
      fetcher_(fetcher),
      options_(std::move(options)) {}

std::vector<CategoryReport> Pipeline::Run() {
  const std::string generated_at =
      options_.generated_at.empty() ? internal::UtcTimestamp() : options_.generated_at;

  std::vector<CategoryReport> reports(categories_.size());
  internal::ParallelFor(categories_.size(), options_.category_concurrency,
                        [&](size_t i) {
                          reports[i] = RunCategoryAt(categories_[i], generated_at);
                        });
  return reports;
}

CategoryReport Pipeline::RunCategory(const CategoryDescriptor& category) {
  return RunCategoryAt(category, options_.generated_at.empty()
                                     ? internal::UtcTimestamp()
                                     : options_.generated_at);
}

CategoryReport Pipeline::RunCategoryAt(const CategoryDescriptor& category,
                                       const std::string& generated_at) {
  CategoryReport report;
  report.name = category.name;
  report.output_path = category.output_path;

  const std::string upper = ToUpper(category.name);
  LOG_INFO << "Processing " << upper << " rules...";

  try {
    if (!FileExists(category.sources_path) && !FileExists(category.rules_path)) {
      LOG_WARN << upper << ": neither " << category.sources_path << " nor "
               << category.rules_path << " exists, skipping";
      report.skipped = true;
      return report;
    }

    std::vector<std::string> raw_lines = CollectRawLines(category, &report);

    std::vector<std::string> exclude_lines;
    if (auto lines = ReadLines(category.exclude_path)) {
      exclude_lines = std::move(*lines);
    }

    report.entries = ProcessLines(raw_lines, exclude_lines, &report.stats);

    const auto& s = report.stats;
    LOG_INFO << upper << ": normalized " << s.normalized << " of " << s.raw_lines
             << " lines";
    if (s.allowlist_entries > 0) {
      LOG_INFO << upper << ": allowlist (" << s.allowlist_entries
               << " entries) filtered out " << s.excluded << " rules";
    } else {
      LOG_INFO << upper << ": no allowlist, skipping filter";
    }
    LOG_INFO << upper << ": " << s.unique_rules << " unique rules, "
             << report.entries.size() << " domains";

    DocumentHeader header;
    header.category = category.name;
    header.generated_at = generated_at;
    header.homepage = options_.homepage;
    report.document = RenderDocument(header, report.entries);

    std::string error;
    if (!WriteFileAtomic(category.output_path, report.document, &error)) {
      report.error = error;
      LOG_ERROR << upper << ": failed to write " << category.output_path << ": "
                << error;
    } else {
      report.written = true;
      LOG_INFO << "Generated " << category.output_path;
    }
  } catch (const std::exception& e) {
    report.error = e.what();
    LOG_ERROR << upper << ": " << e.what();
  }

  if (options_.metrics) {
    auto& m = *options_.metrics;
    m.Gauge(CategoryMetric("rulemerge_sources", category.name),
            static_cast<double>(report.sources_total));
    m.Gauge(CategoryMetric("rulemerge_sources_failed", category.name),
            static_cast<double>(report.sources_failed));
    m.Gauge(CategoryMetric("rulemerge_rules_normalized", category.name),
            static_cast<double>(report.stats.normalized));
    m.Gauge(CategoryMetric("rulemerge_rules_excluded", category.name),
            static_cast<double>(report.stats.excluded));
    m.Gauge(CategoryMetric("rulemerge_entries", category.name),
            static_cast<double>(report.entries.size()));
    if (!report.ok()) {
      m.Counter("rulemerge_category_failures_total", 1);
    }
  }
  return report;
}

std::vector<std::string> Pipeline::CollectRawLines(const CategoryDescriptor& category,
                                                   CategoryReport* report) {
  std::vector<std::string> raw_lines;
  const std::string upper = ToUpper(category.name);

  auto source_lines = ReadLines(category.sources_path);
  if (!source_lines) {
    LOG_WARN << upper << ": " << category.sources_path
             << " not found, skipping download";
  } else {
    std::vector<std::string> urls = ParseSourcesList(*source_lines);
    report->sources_total = urls.size();

    if (!fetcher_ && !urls.empty()) {
      LOG_WARN << upper << ": no fetcher configured, skipping " << urls.size()
               << " sources";
      report->sources_failed = urls.size();
    } else if (!urls.empty()) {
      auto results = FetchAll(*fetcher_, urls, options_.fetch_concurrency,
                              options_.metrics.get());
      for (size_t i = 0; i < urls.size(); ++i) {
        const FetchResult& r = results[i];
        if (!r.ok()) {
          ++report->sources_failed;
          LOG_WARN << "  -> " << urls[i] << ": " << FetchStatusName(r.status)
                   << " (" << r.message << ")";
          continue;
        }
        auto lines = internal::SplitLines(r.body);
        LOG_INFO << "  -> " << urls[i] << ": " << lines.size() << " lines in "
                 << r.latency_ms << " ms";
        AppendLines(&raw_lines, std::move(lines));
      }
    }
  }

  if (auto manual = ReadLines(category.rules_path)) {
    LOG_INFO << "  -> Added " << manual->size() << " manual lines from "
             << category.rules_path;
    AppendLines(&raw_lines, std::move(*manual));
  }
  return raw_lines;
}

std::vector<std::string> Pipeline::ProcessLines(
    const std::vector<std::string>& raw_lines,
    const std::vector<std::string>& exclude_lines,
    ProcessStats* stats) {
  const Allowlist allowlist = Allowlist::Build(exclude_lines);

  std::vector<NormalizedRule> normalized = NormalizeLines(raw_lines);
  std::vector<NormalizedRule> filtered = allowlist.Filter(normalized);
  RuleSet unique = Dedup(filtered);
  std::vector<std::string> entries = ProjectAll(unique);

  if (stats) {
    stats->raw_lines = raw_lines.size();
    stats->normalized = normalized.size();
    stats->excluded = normalized.size() - filtered.size();
    stats->unique_rules = unique.size();
    stats->allowlist_entries = allowlist.size();
  }
  return entries;
}

}  // namespace rulemerge
