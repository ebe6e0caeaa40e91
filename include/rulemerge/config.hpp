#pragma once

#include <rulemerge/category.hpp>
#include <rulemerge/fetcher.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace rulemerge {

/**
 * Fetch configuration.
 */
struct FetchConfig {
  uint32_t timeout_ms = 30000;
  uint32_t max_attempts = 1;
  uint32_t max_redirects = 5;
  uint32_t concurrency = 4;
  std::string user_agent;  // Empty = "rulemerge/<version>"

  FetchOptions ToOptions() const;
};

/**
 * Output configuration.
 */
struct OutputConfig {
  std::string homepage;      // Optional header line in every document
  std::string manifest;      // JSON build manifest path (empty = none)
  std::string metrics_file;  // Prometheus textfile path (empty = none)
};

/**
 * Complete run configuration.
 */
struct Config {
  std::string root = ".";        // Directory holding <category>/ subdirectories
  std::string output_dir = ".";  // Where final_<category>.yaml files go
  std::vector<std::string> categories = {"reject", "proxy", "direct", "microsoft"};
  std::string log_level = "info";
  uint32_t category_concurrency = 4;
  FetchConfig fetch;
  OutputConfig output;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is loaded first; explicit flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /** Category descriptors in configured order (conventional layout). */
  std::vector<CategoryDescriptor> Descriptors() const;
};

}  // namespace rulemerge
