#include <rulemerge/config.hpp>
#include <rulemerge/fetcher.hpp>
#include <rulemerge/internal.hpp>
#include <rulemerge/io.hpp>
#include <rulemerge/manifest.hpp>
#include <rulemerge/metrics.hpp>
#include <rulemerge/pipeline.hpp>
#include <rulemerge/version.hpp>

#include <trantor/utils/Logger.h>

#include <exception>
#include <iostream>
#include <memory>

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    // Parse configuration from command line (and optionally config file)
    auto config = rulemerge::Config::LoadFromArgs(argc, argv);
    config.Validate();
    trantor::Logger::setLogLevel(ToLogLevel(config.log_level));

    LOG_INFO << "rulemerge " << rulemerge::Version() << " building "
             << config.categories.size() << " categories from " << config.root;

    std::shared_ptr<rulemerge::PrometheusMetrics> metrics;
    if (!config.output.metrics_file.empty()) {
      metrics = std::make_shared<rulemerge::PrometheusMetrics>();
    }

    rulemerge::PipelineOptions options;
    options.fetch_concurrency = config.fetch.concurrency;
    options.category_concurrency = config.category_concurrency;
    options.generated_at = rulemerge::internal::UtcTimestamp();
    options.homepage = config.output.homepage;
    options.metrics = metrics;

    rulemerge::HttpFetcher fetcher(config.fetch.ToOptions());
    rulemerge::Pipeline pipeline(config.Descriptors(), &fetcher, options);
    auto reports = pipeline.Run();

    int exit_code = 0;
    for (const auto& report : reports) {
      if (!report.ok()) exit_code = 1;
    }

    std::string error;
    if (!config.output.manifest.empty()) {
      auto manifest = rulemerge::BuildManifest(reports, options.generated_at);
      if (!rulemerge::WriteFileAtomic(config.output.manifest, manifest, &error)) {
        LOG_ERROR << "Failed to write manifest: " << error;
        exit_code = 1;
      }
    }
    if (metrics && !metrics->WriteTextfile(config.output.metrics_file, &error)) {
      LOG_ERROR << "Failed to write metrics: " << error;
      exit_code = 1;
    }

    std::cout << "Generated files:\n";
    for (const auto& report : reports) {
      if (report.written) {
        std::cout << "  - " << report.output_path << " (" << report.entries.size()
                  << " domains)\n";
      } else if (!report.ok()) {
        std::cout << "  - " << report.name << ": FAILED (" << report.error << ")\n";
      }
    }
    return exit_code;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
