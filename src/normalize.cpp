#include <rulemerge/normalize.hpp>

#include <regex>

namespace rulemerge {

namespace {

// Far above any domain or CIDR; keeps pathological lines away from std::regex.
constexpr size_t kMaxLineLength = 4096;

inline bool IsWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
         c == '\v' || c == '\f';
}

inline char AsciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool LooksLikeDomain(std::string_view value) {
  return !value.empty() && value.find(':') == std::string_view::npos &&
         value.find('@') == std::string_view::npos;
}

// All patterns run on CleanLine() output, so they only need lower case.
const std::regex& PayloadMarkerPattern() {
  static const std::regex re(R"(^payload:\s*$)");
  return re;
}

const std::regex& YamlItemPattern() {
  static const std::regex re(R"(^-\s+(.+)$)");
  return re;
}

const std::regex& TextRulePattern() {
  static const std::regex re(
      R"(^(domain-suffix|domain-keyword|domain|ip-cidr6|ip-cidr|ip-asn)\s*,\s*([^,]+))");
  return re;
}

const std::regex& Ipv4CidrPattern() {
  static const std::regex re(R"(^[0-9]+\.[0-9]+\.[0-9]+\.[0-9]+/[0-9]+$)");
  return re;
}

const std::regex& Ipv6CidrPattern() {
  static const std::regex re(R"(^[0-9a-f:]+:[0-9a-f:]*/[0-9]+$)");
  return re;
}

std::string Trim(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && IsWhitespace(s[start])) ++start;
  size_t end = s.size();
  while (end > start && IsWhitespace(s[end - 1])) --end;
  return std::string(s.substr(start, end - start));
}

// TYPE,value lines. DOMAIN-KEYWORD is recognized only to be dropped.
std::optional<NormalizedRule> ClassifyTextRule(const std::string& line,
                                               bool* matched) {
  std::smatch m;
  *matched = std::regex_search(line, m, TextRulePattern());
  if (!*matched) return std::nullopt;

  auto kind = ParseKind(m.str(1));
  if (!kind || *kind == RuleKind::kDomainKeyword) return std::nullopt;

  std::string value = Trim(m.str(2));
  if (*kind == RuleKind::kDomainSuffix) {
    value = std::string(internal::StripSuffixPrefix(value));
  }
  if (value.empty()) return std::nullopt;
  return NormalizedRule{*kind, std::move(value)};
}

std::optional<NormalizedRule> ClassifyCidr(const std::string& value) {
  if (internal::IsIpv4Cidr(value)) return NormalizedRule{RuleKind::kIpCidr, value};
  if (internal::IsIpv6Cidr(value)) return NormalizedRule{RuleKind::kIpCidr6, value};
  return std::nullopt;
}

std::optional<NormalizedRule> ClassifyYamlItem(const std::string& literal) {
  std::string content = Trim(literal);

  if (auto cidr = ClassifyCidr(content)) return cidr;

  if (StartsWith(content, "+.") || StartsWith(content, "*.") ||
      StartsWith(content, ".")) {
    std::string value(internal::StripSuffixPrefix(content));
    if (value.empty()) return std::nullopt;
    return NormalizedRule{RuleKind::kDomainSuffix, std::move(value)};
  }

  // Classical rule-provider payloads list "TYPE,value" items.
  bool matched = false;
  auto text_rule = ClassifyTextRule(content, &matched);
  if (matched) return text_rule;

  if (LooksLikeDomain(content)) {
    return NormalizedRule{RuleKind::kDomain, std::move(content)};
  }
  return std::nullopt;
}

}  // namespace

std::string CleanLine(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  for (char c : line) {
    if (c == '\'') continue;
    out += AsciiLower(c);
  }
  return Trim(out);
}

std::optional<NormalizedRule> NormalizeRule(std::string_view raw) {
  const std::string line = CleanLine(raw);

  if (line.empty() || line[0] == '#') return std::nullopt;
  if (line.size() > kMaxLineLength) return std::nullopt;
  if (std::regex_match(line, PayloadMarkerPattern())) return std::nullopt;

  std::smatch m;
  if (std::regex_match(line, m, YamlItemPattern())) {
    return ClassifyYamlItem(m.str(1));
  }

  bool matched = false;
  auto text_rule = ClassifyTextRule(line, &matched);
  if (matched) return text_rule;

  if (auto cidr = ClassifyCidr(line)) return cidr;
  if (LooksLikeDomain(line)) return NormalizedRule{RuleKind::kDomain, line};
  return std::nullopt;
}

std::vector<NormalizedRule> NormalizeLines(const std::vector<std::string>& lines) {
  std::vector<NormalizedRule> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (auto rule = NormalizeRule(line)) {
      out.push_back(std::move(*rule));
    }
  }
  return out;
}

namespace internal {

std::string_view StripSuffixPrefix(std::string_view value) {
  while (true) {
    if (StartsWith(value, "+.") || StartsWith(value, "*.")) {
      value.remove_prefix(2);
    } else if (StartsWith(value, ".")) {
      value.remove_prefix(1);
    } else {
      return value;
    }
  }
}

bool IsIpv4Cidr(std::string_view value) {
  return std::regex_match(value.begin(), value.end(), Ipv4CidrPattern());
}

bool IsIpv6Cidr(std::string_view value) {
  return std::regex_match(value.begin(), value.end(), Ipv6CidrPattern());
}

}  // namespace internal
}  // namespace rulemerge
