#include <rulemerge/document.hpp>
#include <rulemerge/version.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rulemerge {

namespace {

constexpr const char* kRule = "#########################################";

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

}  // namespace

std::string RenderDocument(const DocumentHeader& header,
                           const std::vector<std::string>& entries) {
  std::ostringstream out;
  out << kRule << "\n";
  out << "# Generator: rulemerge " << Version() << "\n";
  if (!header.homepage.empty()) {
    out << "# Homepage: " << header.homepage << "\n";
  }
  out << "# Updated: " << header.generated_at << "\n";
  out << "# Description: auto-generated Clash " << ToUpper(header.category)
      << " rules (behavior: domain).\n";
  out << kRule << "\n";
  out << "payload:\n";
  for (const auto& entry : entries) {
    out << "  - '" << entry << "'\n";
  }
  return out.str();
}

}  // namespace rulemerge
