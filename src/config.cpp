#include <rulemerge/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rulemerge {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --root <dir>              Directory with <category>/ inputs (default: .)\n"
            << "  --output-dir, -o <dir>    Output directory (default: .)\n"
            << "  --categories <a,b,...>    Categories to build\n"
            << "                            (default: reject,proxy,direct,microsoft)\n"
            << "  --timeout-ms <ms>         Per-request fetch timeout (default: 30000)\n"
            << "  --max-attempts <n>        Fetch attempts per source (default: 1)\n"
            << "  --concurrency <n>         Parallel fetches per category (default: 4)\n"
            << "  --manifest <path>         Write a JSON build manifest\n"
            << "  --metrics-file <path>     Write Prometheus textfile metrics\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --root . --output-dir .\n"
            << "  " << argv0 << " --config rulemerge.yaml --categories reject,proxy\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

uint32_t ParseUint(const std::string& key, const std::string& value) {
  try {
    size_t pos = 0;
    unsigned long v = std::stoul(value, &pos);
    if (pos != value.size() || v > 0xFFFFFFFFul) {
      throw std::out_of_range(value);
    }
    return static_cast<uint32_t>(v);
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
}

std::vector<std::string> ParseList(const std::string& value) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    std::string item = Trim(value.substr(start, comma - start));
    if (!item.empty()) items.push_back(item);
    start = comma + 1;
  }
  return items;
}

std::string RequireValue(int argc, char** argv, int* i, const std::string& what) {
  if (++*i >= argc) {
    throw std::runtime_error(std::string(argv[*i - 1]) + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

FetchOptions FetchConfig::ToOptions() const {
  FetchOptions options;
  options.timeout_ms = timeout_ms;
  options.max_attempts = max_attempts;
  options.max_redirects = max_redirects;
  options.user_agent = user_agent;
  return options;
}

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    // Section membership is decided by indentation
    const bool indented = !line.empty() && (line[0] == ' ' || line[0] == '\t');
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      throw std::runtime_error("Malformed line in " + path + ": " + line);
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty() && !indented) {
      current_section = key;
      continue;
    }
    if (!indented) {
      current_section.clear();
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    if (current_section == "fetch") {
      if (key == "timeout_ms") {
        config.fetch.timeout_ms = ParseUint("fetch.timeout_ms", value);
      } else if (key == "max_attempts") {
        config.fetch.max_attempts = ParseUint("fetch.max_attempts", value);
      } else if (key == "max_redirects") {
        config.fetch.max_redirects = ParseUint("fetch.max_redirects", value);
      } else if (key == "concurrency") {
        config.fetch.concurrency = ParseUint("fetch.concurrency", value);
      } else if (key == "user_agent") {
        config.fetch.user_agent = value;
      }
    } else if (current_section == "pipeline") {
      if (key == "category_concurrency") {
        config.category_concurrency = ParseUint("pipeline.category_concurrency", value);
      }
    } else if (current_section == "output") {
      if (key == "homepage") {
        config.output.homepage = value;
      } else if (key == "manifest") {
        config.output.manifest = value;
      } else if (key == "metrics_file") {
        config.output.metrics_file = value;
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "root") {
        config.root = value;
      } else if (key == "output_dir") {
        config.output_dir = value;
      } else if (key == "categories") {
        config.categories = ParseList(value);
      } else if (key == "log_level") {
        config.log_level = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // A config file provides the base; every other flag overrides it.
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      config = LoadFromFile(RequireValue(argc, argv, &i, "a path argument"));
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--root") {
      config.root = RequireValue(argc, argv, &i, "a directory");
    } else if (arg == "--output-dir" || arg == "-o") {
      config.output_dir = RequireValue(argc, argv, &i, "a directory");
    } else if (arg == "--categories") {
      config.categories = ParseList(RequireValue(argc, argv, &i, "a category list"));
    } else if (arg == "--timeout-ms") {
      config.fetch.timeout_ms =
          ParseUint(arg, RequireValue(argc, argv, &i, "a number"));
    } else if (arg == "--max-attempts") {
      config.fetch.max_attempts =
          ParseUint(arg, RequireValue(argc, argv, &i, "a number"));
    } else if (arg == "--concurrency") {
      config.fetch.concurrency =
          ParseUint(arg, RequireValue(argc, argv, &i, "a number"));
    } else if (arg == "--manifest") {
      config.output.manifest = RequireValue(argc, argv, &i, "a path");
    } else if (arg == "--metrics-file") {
      config.output.metrics_file = RequireValue(argc, argv, &i, "a path");
    } else if (arg == "--log-level") {
      config.log_level = RequireValue(argc, argv, &i, "a level");
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    } else {
      throw std::runtime_error("Unexpected argument: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (categories.empty()) {
    throw std::runtime_error("At least one category is required");
  }
  for (const auto& name : categories) {
    if (name.find('/') != std::string::npos || name == "." || name == "..") {
      throw std::runtime_error("Invalid category name: " + name);
    }
  }

  if (fetch.timeout_ms == 0) {
    throw std::runtime_error("fetch.timeout_ms must be positive");
  }
  if (fetch.max_attempts == 0) {
    throw std::runtime_error("fetch.max_attempts must be at least 1");
  }
  if (fetch.concurrency == 0 || category_concurrency == 0) {
    throw std::runtime_error("Concurrency settings must be at least 1");
  }

  // Validate log level
  if (log_level != "debug" && log_level != "info" &&
      log_level != "warn" && log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + log_level +
                             " (must be debug, info, warn, or error)");
  }
}

std::vector<CategoryDescriptor> Config::Descriptors() const {
  std::vector<CategoryDescriptor> out;
  out.reserve(categories.size());
  for (const auto& name : categories) {
    out.push_back(CategoryDescriptor::FromRoot(root, output_dir, name));
  }
  return out;
}

}  // namespace rulemerge
