// Unit tests for rulemerge/normalize.hpp
// Tests: line cleaning, YAML array items, TYPE,value rules, bare fallback

#include <gtest/gtest.h>

#include <rulemerge/normalize.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace rulemerge {
namespace {

NormalizedRule Rule(RuleKind kind, const std::string& value) {
  return NormalizedRule{kind, value};
}

std::string ToUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

// =============================================================================
// CleanLine Tests
// =============================================================================

TEST(CleanLineTest, StripsQuotesTrimsAndLowercases) {
  EXPECT_EQ(CleanLine("  'Example.COM'  "), "example.com");
  EXPECT_EQ(CleanLine("\tDOMAIN,A.com\r"), "domain,a.com");
  EXPECT_EQ(CleanLine("a'b'c"), "abc");
}

TEST(CleanLineTest, EmptyAndWhitespaceOnly) {
  EXPECT_EQ(CleanLine(""), "");
  EXPECT_EQ(CleanLine(" \t\r\n"), "");
  EXPECT_EQ(CleanLine("''"), "");
}

TEST(CleanLineTest, PreservesNonASCII) {
  EXPECT_EQ(CleanLine("B\xc3\xbc" "cher.DE"), "b\xc3\xbc" "cher.de");
}

// =============================================================================
// Noise Lines
// =============================================================================

class NormalizeNoiseTest : public ::testing::Test {};

TEST_F(NormalizeNoiseTest, BlankLines) {
  EXPECT_FALSE(NormalizeRule(""));
  EXPECT_FALSE(NormalizeRule("   "));
  EXPECT_FALSE(NormalizeRule("''"));
  EXPECT_FALSE(NormalizeRule("\r"));
}

TEST_F(NormalizeNoiseTest, Comments) {
  EXPECT_FALSE(NormalizeRule("# comment"));
  EXPECT_FALSE(NormalizeRule("   # indented comment"));
  EXPECT_FALSE(NormalizeRule("#DOMAIN,a.com"));
}

TEST_F(NormalizeNoiseTest, PayloadMarker) {
  EXPECT_FALSE(NormalizeRule("payload:"));
  EXPECT_FALSE(NormalizeRule("  payload:  "));
  EXPECT_FALSE(NormalizeRule("PAYLOAD:"));
}

TEST_F(NormalizeNoiseTest, OverlongLine) {
  EXPECT_FALSE(NormalizeRule(std::string(5000, 'a') + ".com"));
}

// =============================================================================
// YAML Array Form
// =============================================================================

class NormalizeYamlTest : public ::testing::Test {};

TEST_F(NormalizeYamlTest, SuffixPrefixes) {
  EXPECT_EQ(NormalizeRule("  - '+.example.com'"),
            Rule(RuleKind::kDomainSuffix, "example.com"));
  EXPECT_EQ(NormalizeRule("  - '*.example.com'"),
            Rule(RuleKind::kDomainSuffix, "example.com"));
  EXPECT_EQ(NormalizeRule("  - '.example.com'"),
            Rule(RuleKind::kDomainSuffix, "example.com"));
}

TEST_F(NormalizeYamlTest, PlainDomain) {
  EXPECT_EQ(NormalizeRule("  - 'Example.COM'"), Rule(RuleKind::kDomain, "example.com"));
  EXPECT_EQ(NormalizeRule("- example.com"), Rule(RuleKind::kDomain, "example.com"));
}

TEST_F(NormalizeYamlTest, Cidrs) {
  EXPECT_EQ(NormalizeRule("  - '1.1.1.0/24'"), Rule(RuleKind::kIpCidr, "1.1.1.0/24"));
  EXPECT_EQ(NormalizeRule("  - '2001:DB8::/32'"),
            Rule(RuleKind::kIpCidr6, "2001:db8::/32"));
}

TEST_F(NormalizeYamlTest, ColonOrAtIsDropped) {
  EXPECT_FALSE(NormalizeRule("  - 'user@example.com'"));
  EXPECT_FALSE(NormalizeRule("  - 'https://example.com'"));
  EXPECT_FALSE(NormalizeRule("  - 'example.com:443'"));
}

TEST_F(NormalizeYamlTest, WindowsLineEnding) {
  EXPECT_EQ(NormalizeRule("  - '+.example.com'\r"),
            Rule(RuleKind::kDomainSuffix, "example.com"));
}

TEST_F(NormalizeYamlTest, ClassicalPayloadItems) {
  EXPECT_EQ(NormalizeRule("  - DOMAIN-SUFFIX,google.com"),
            Rule(RuleKind::kDomainSuffix, "google.com"));
  EXPECT_EQ(NormalizeRule("  - IP-CIDR,10.0.0.0/8,no-resolve"),
            Rule(RuleKind::kIpCidr, "10.0.0.0/8"));
  EXPECT_FALSE(NormalizeRule("  - DOMAIN-KEYWORD,ads"));
}

TEST_F(NormalizeYamlTest, BarePrefixIsDropped) {
  EXPECT_FALSE(NormalizeRule("  - '+.'"));
  EXPECT_FALSE(NormalizeRule("  - '.'"));
}

// =============================================================================
// Text Form
// =============================================================================

class NormalizeTextTest : public ::testing::Test {};

TEST_F(NormalizeTextTest, AllKinds) {
  EXPECT_EQ(NormalizeRule("DOMAIN,a.com"), Rule(RuleKind::kDomain, "a.com"));
  EXPECT_EQ(NormalizeRule("DOMAIN-SUFFIX,Example.COM"),
            Rule(RuleKind::kDomainSuffix, "example.com"));
  EXPECT_EQ(NormalizeRule("IP-CIDR,1.2.3.0/24"), Rule(RuleKind::kIpCidr, "1.2.3.0/24"));
  EXPECT_EQ(NormalizeRule("IP-CIDR6,2001:db8::/32"),
            Rule(RuleKind::kIpCidr6, "2001:db8::/32"));
  EXPECT_EQ(NormalizeRule("IP-ASN,13335"), Rule(RuleKind::kAsn, "13335"));
}

TEST_F(NormalizeTextTest, KeywordIsSkipped) {
  EXPECT_FALSE(NormalizeRule("DOMAIN-KEYWORD,ads"));
  EXPECT_FALSE(NormalizeRule("domain-keyword,ads"));
}

TEST_F(NormalizeTextTest, ExtraFieldsAndSpacing) {
  EXPECT_EQ(NormalizeRule("DOMAIN-SUFFIX , google.com , Proxy"),
            Rule(RuleKind::kDomainSuffix, "google.com"));
  EXPECT_EQ(NormalizeRule("IP-CIDR,192.168.0.0/16,no-resolve"),
            Rule(RuleKind::kIpCidr, "192.168.0.0/16"));
}

TEST_F(NormalizeTextTest, SuffixValueIsStripped) {
  EXPECT_EQ(NormalizeRule("DOMAIN-SUFFIX,+.x.com"), Rule(RuleKind::kDomainSuffix, "x.com"));
  EXPECT_EQ(NormalizeRule("DOMAIN-SUFFIX,*.x.com"), Rule(RuleKind::kDomainSuffix, "x.com"));
  EXPECT_EQ(NormalizeRule("DOMAIN-SUFFIX,.x.com"), Rule(RuleKind::kDomainSuffix, "x.com"));
  EXPECT_EQ(NormalizeRule("DOMAIN-SUFFIX,+.*.x.com"), Rule(RuleKind::kDomainSuffix, "x.com"));
  EXPECT_FALSE(NormalizeRule("DOMAIN-SUFFIX,+."));
  // Only suffix rules carry a wildcard prefix.
  EXPECT_EQ(NormalizeRule("DOMAIN,.x.com"), Rule(RuleKind::kDomain, ".x.com"));
}

TEST_F(NormalizeTextTest, UnknownTypeFallsThrough) {
  // Not a recognized type, and the comma-joined literal has a colon.
  EXPECT_FALSE(NormalizeRule("GEOIP,CN:x"));
  EXPECT_FALSE(NormalizeRule("MATCH,DIRECT@x"));
}

// =============================================================================
// Bare Fallback
// =============================================================================

class NormalizeBareTest : public ::testing::Test {};

TEST_F(NormalizeBareTest, Domains) {
  EXPECT_EQ(NormalizeRule("Example.com"), Rule(RuleKind::kDomain, "example.com"));
  EXPECT_EQ(NormalizeRule("  example.com  "), Rule(RuleKind::kDomain, "example.com"));
}

TEST_F(NormalizeBareTest, Cidrs) {
  EXPECT_EQ(NormalizeRule("10.0.0.0/8"), Rule(RuleKind::kIpCidr, "10.0.0.0/8"));
  EXPECT_EQ(NormalizeRule("fe80::/10"), Rule(RuleKind::kIpCidr6, "fe80::/10"));
}

TEST_F(NormalizeBareTest, MalformedIsDropped) {
  EXPECT_FALSE(NormalizeRule("mailto:someone"));
  EXPECT_FALSE(NormalizeRule("someone@example.com"));
  EXPECT_FALSE(NormalizeRule("fe80::1"));  // IPv6 address without mask
}

// =============================================================================
// Properties
// =============================================================================

TEST(NormalizePropertyTest, BothFormatsAgree) {
  auto a = NormalizeRule("DOMAIN-SUFFIX,Example.COM");
  auto b = NormalizeRule("- '+.example.com'");
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(*a, *b);
  EXPECT_EQ(*a, Rule(RuleKind::kDomainSuffix, "example.com"));
}

TEST(NormalizePropertyTest, CaseInsensitiveRoundTrip) {
  const std::string lines[] = {
      "DOMAIN,a.com",         "DOMAIN-SUFFIX,b.example.org",
      "domain-suffix,c.net",  "IP-CIDR,1.2.3.0/24",
      "IP-CIDR6,2001:db8::/32", "- '+.b.com'",
      "  - '*.Mixed.Case.io'", "- 'fe80::/10'",
      "plain.example.com",    "DOMAIN-KEYWORD,spam",
  };
  for (const auto& line : lines) {
    EXPECT_EQ(NormalizeRule(line), NormalizeRule(ToUpper(line))) << line;
  }
}

TEST(NormalizePropertyTest, SuffixInvariantHolds) {
  const std::string lines[] = {"- '+.x.com'",           "- '*.x.com'",
                               "- '.x.com'",            "- '+.*.x.com'",
                               "DOMAIN-SUFFIX,x.com",   "DOMAIN-SUFFIX,+.x.com",
                               "DOMAIN-SUFFIX,*.x.com", "DOMAIN-SUFFIX,.x.com",
                               "  - DOMAIN-SUFFIX,+.x.com"};
  for (const auto& line : lines) {
    auto rule = NormalizeRule(line);
    ASSERT_TRUE(rule) << line;
    EXPECT_EQ(rule->kind, RuleKind::kDomainSuffix);
    EXPECT_EQ(rule->value, "x.com") << line;
  }
}

TEST(NormalizeLinesTest, DropsSkippedAndKeepsOrder) {
  std::vector<std::string> lines = {"payload:", "  - 'b.com'", "# c", "DOMAIN,a.com",
                                    "DOMAIN-KEYWORD,x", ""};
  auto rules = NormalizeLines(lines);
  ASSERT_EQ(rules.size(), 2u);
  EXPECT_EQ(rules[0], Rule(RuleKind::kDomain, "b.com"));
  EXPECT_EQ(rules[1], Rule(RuleKind::kDomain, "a.com"));
}

}  // namespace
}  // namespace rulemerge
