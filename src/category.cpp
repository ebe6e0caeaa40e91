#include <rulemerge/category.hpp>

#include <filesystem>

namespace rulemerge {

namespace fs = std::filesystem;

CategoryDescriptor CategoryDescriptor::FromRoot(const std::string& root,
                                                const std::string& output_dir,
                                                const std::string& name) {
  const fs::path dir = fs::path(root) / name;
  CategoryDescriptor desc;
  desc.name = name;
  desc.sources_path = (dir / "sources.list").string();
  desc.rules_path = (dir / "rules.txt").string();
  desc.exclude_path = (dir / "exclude.txt").string();
  desc.output_path = (fs::path(output_dir) / ("final_" + name + ".yaml")).string();
  return desc;
}

std::vector<std::string> ParseSourcesList(const std::vector<std::string>& lines) {
  std::vector<std::string> urls;
  for (const auto& line : lines) {
    size_t start = line.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) continue;
    size_t end = line.find_last_not_of(" \t\r\n");
    std::string url = line.substr(start, end - start + 1);
    if (url[0] == '#') continue;
    urls.push_back(std::move(url));
  }
  return urls;
}

}  // namespace rulemerge
