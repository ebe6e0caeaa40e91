#pragma once

#include <rulemerge/rule.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rulemerge {

/**
 * Shared text primitive for rule lines and allowlist lines.
 *
 * Removes every single-quote character, trims surrounding whitespace
 * (space, tab, CR, LF, VT, FF) and folds ASCII A-Z to a-z. Non-ASCII bytes
 * pass through unchanged.
 */
std::string CleanLine(std::string_view line);

/**
 * Canonicalize one raw source line.
 *
 * Recognizes, in order of precedence:
 *   - comments, blank lines and the "payload:" marker (skipped)
 *   - YAML array items:  - '+.example.com' / - '1.2.3.0/24' / - 'a.com'
 *   - text rules:        DOMAIN-SUFFIX,example.com / IP-CIDR,1.2.3.0/24
 *   - bare values:       example.com / 1.2.3.0/24
 *
 * DOMAIN-KEYWORD rules and anything unclassifiable return std::nullopt.
 * Never throws on malformed input.
 */
std::optional<NormalizedRule> NormalizeRule(std::string_view line);

/** NormalizeRule over a sequence, dropping skipped lines. Order is kept. */
std::vector<NormalizedRule> NormalizeLines(const std::vector<std::string>& lines);

namespace internal {

/** Strip every leading "+.", "*." or "." from a domain-suffix value. */
std::string_view StripSuffixPrefix(std::string_view value);

bool IsIpv4Cidr(std::string_view value);
bool IsIpv6Cidr(std::string_view value);

}  // namespace internal
}  // namespace rulemerge
