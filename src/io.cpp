#include <rulemerge/io.hpp>
#include <rulemerge/internal.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace rulemerge {

namespace fs = std::filesystem;

bool FileExists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::optional<std::vector<std::string>> ReadLines(const std::string& path) {
  if (!FileExists(path)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::ostringstream buf;
  buf << file.rdbuf();
  return internal::SplitLines(buf.str());
}

bool WriteFileAtomic(const std::string& path, const std::string& content,
                     std::string* error) {
  std::error_code ec;
  fs::path target(path);
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      if (error) *error = "cannot create directory " +
                          target.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream file(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      if (error) *error = "cannot open " + tmp;
      return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
      if (error) *error = "write failed: " + tmp;
      file.close();
      fs::remove(tmp, ec);
      return false;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    if (error) *error = "cannot rename " + tmp + " to " + path + ": " + ec.message();
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return false;
  }
  return true;
}

}  // namespace rulemerge
