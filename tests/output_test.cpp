// Tests for document rendering, the JSON manifest, Prometheus export and
// file helpers.

#include <gtest/gtest.h>

#include <rulemerge/category.hpp>
#include <rulemerge/document.hpp>
#include <rulemerge/internal.hpp>
#include <rulemerge/io.hpp>
#include <rulemerge/manifest.hpp>
#include <rulemerge/metrics.hpp>
#include <rulemerge/test_utils.hpp>
#include <rulemerge/version.hpp>

#include <json/json.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace rulemerge {
namespace {

using testing::TempDir;

// =============================================================================
// Document
// =============================================================================

TEST(DocumentTest, ExactLayout) {
  DocumentHeader header;
  header.category = "reject";
  header.generated_at = "2026-10-19T08:00:00Z";

  std::string doc = RenderDocument(header, {"+.ads.com", "tracker.net"});
  std::string expected =
      "#########################################\n"
      "# Generator: rulemerge " + std::string(Version()) + "\n"
      "# Updated: 2026-10-19T08:00:00Z\n"
      "# Description: auto-generated Clash REJECT rules (behavior: domain).\n"
      "#########################################\n"
      "payload:\n"
      "  - '+.ads.com'\n"
      "  - 'tracker.net'\n";
  EXPECT_EQ(doc, expected);
}

TEST(DocumentTest, HomepageLine) {
  DocumentHeader header;
  header.category = "proxy";
  header.generated_at = "2026-10-19T08:00:00Z";
  header.homepage = "https://example.com/rules";

  std::string doc = RenderDocument(header, {});
  EXPECT_NE(doc.find("# Homepage: https://example.com/rules\n"), std::string::npos);
  EXPECT_LT(doc.find("# Homepage:"), doc.find("# Updated:"));
  EXPECT_EQ(doc.substr(doc.size() - 9), "payload:\n");
}

TEST(DocumentTest, OnlyEntryLinesAreItems) {
  DocumentHeader header;
  header.category = "direct";
  header.generated_at = "2026-10-19T08:00:00Z";
  std::vector<std::string> entries = {"+.a.com", "b.com", "c.com"};

  std::istringstream in(RenderDocument(header, entries));
  std::string line;
  size_t items = 0;
  while (std::getline(in, line)) {
    if (line.rfind("  - '", 0) == 0) ++items;
  }
  EXPECT_EQ(items, entries.size());
}

// =============================================================================
// Sources list
// =============================================================================

TEST(SourcesListTest, SkipsBlanksAndComments) {
  std::vector<std::string> lines = {"# upstream", "", "   ", "  https://a.test/x  ",
                                    "https://b.test/y\r", "  # disabled"};
  std::vector<std::string> expected = {"https://a.test/x", "https://b.test/y"};
  EXPECT_EQ(ParseSourcesList(lines), expected);
}

// =============================================================================
// Manifest
// =============================================================================

TEST(ManifestTest, DescribesEveryCategory) {
  CategoryReport written;
  written.name = "reject";
  written.output_path = "/out/final_reject.yaml";
  written.sources_total = 2;
  written.sources_failed = 1;
  written.stats.raw_lines = 10;
  written.stats.normalized = 7;
  written.stats.excluded = 1;
  written.stats.unique_rules = 5;
  written.entries = {"+.a.com", "b.com"};
  written.document = "payload:\n  - '+.a.com'\n  - 'b.com'\n";
  written.written = true;

  CategoryReport skipped;
  skipped.name = "microsoft";
  skipped.skipped = true;

  CategoryReport failed;
  failed.name = "proxy";
  failed.error = "cannot open /out/final_proxy.yaml.tmp";

  std::string text = BuildManifest({written, skipped, failed}, "2026-10-19T08:00:00Z");

  Json::Value json;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  ASSERT_TRUE(reader->parse(text.data(), text.data() + text.size(), &json, &errors))
      << errors;

  EXPECT_EQ(json["generator"].asString(), "rulemerge");
  EXPECT_EQ(json["version"].asString(), Version());
  EXPECT_EQ(json["generated_at"].asString(), "2026-10-19T08:00:00Z");
  ASSERT_EQ(json["categories"].size(), 3u);

  const Json::Value& c0 = json["categories"][0];
  EXPECT_EQ(c0["name"].asString(), "reject");
  EXPECT_EQ(c0["output"].asString(), "/out/final_reject.yaml");
  EXPECT_TRUE(c0["written"].asBool());
  EXPECT_EQ(c0["entries"].asUInt64(), 2u);
  EXPECT_EQ(c0["sources_total"].asUInt64(), 2u);
  EXPECT_EQ(c0["sources_failed"].asUInt64(), 1u);
  EXPECT_EQ(c0["raw_lines"].asUInt64(), 10u);
  EXPECT_EQ(c0["excluded"].asUInt64(), 1u);
  EXPECT_EQ(c0["sha256"].asString(), internal::Sha256::HexDigest(written.document));
  EXPECT_FALSE(c0.isMember("error"));

  const Json::Value& c1 = json["categories"][1];
  EXPECT_TRUE(c1["skipped"].asBool());
  EXPECT_FALSE(c1.isMember("sha256"));

  const Json::Value& c2 = json["categories"][2];
  EXPECT_FALSE(c2["written"].asBool());
  EXPECT_EQ(c2["error"].asString(), failed.error);
}

TEST(Sha256Test, KnownDigests) {
  EXPECT_EQ(internal::Sha256::HexDigest(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(internal::Sha256::HexDigest("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(TimestampTest, FormatsUtc) {
  auto epoch_plus = std::chrono::system_clock::time_point(std::chrono::seconds(86400 + 3661));
  EXPECT_EQ(internal::UtcTimestamp(epoch_plus), "1970-01-02T01:01:01Z");
}

// =============================================================================
// Prometheus Export
// =============================================================================

TEST(PrometheusMetricsTest, GroupsLabelledSeries) {
  PrometheusMetrics metrics;
  metrics.Counter("rulemerge_fetches_total", 2);
  metrics.Counter("rulemerge_fetches_total", 1);
  metrics.Gauge(CategoryMetric("rulemerge_entries", "proxy"), 12);
  metrics.Gauge(CategoryMetric("rulemerge_entries", "reject"), 3);

  std::string out = metrics.Export();
  EXPECT_NE(out.find("# TYPE rulemerge_fetches_total counter\n"
                     "rulemerge_fetches_total 3\n"),
            std::string::npos);
  EXPECT_NE(out.find("# TYPE rulemerge_entries gauge\n"
                     "rulemerge_entries{category=\"proxy\"} 12\n"
                     "rulemerge_entries{category=\"reject\"} 3\n"),
            std::string::npos);

  size_t first = out.find("# TYPE rulemerge_entries");
  EXPECT_EQ(out.find("# TYPE rulemerge_entries", first + 1), std::string::npos);
}

TEST(PrometheusMetricsTest, HistogramBuckets) {
  PrometheusMetrics metrics;
  metrics.Histogram("rulemerge_fetch_latency_ms", 7);
  metrics.Histogram("rulemerge_fetch_latency_ms", 300);
  metrics.Histogram("rulemerge_fetch_latency_ms", 60000);

  std::string out = metrics.Export();
  EXPECT_NE(out.find("# TYPE rulemerge_fetch_latency_ms histogram\n"), std::string::npos);
  EXPECT_NE(out.find("rulemerge_fetch_latency_ms_bucket{le=\"10\"} 1\n"), std::string::npos);
  EXPECT_NE(out.find("rulemerge_fetch_latency_ms_bucket{le=\"500\"} 2\n"), std::string::npos);
  EXPECT_NE(out.find("rulemerge_fetch_latency_ms_bucket{le=\"30000\"} 2\n"),
            std::string::npos);
  EXPECT_NE(out.find("rulemerge_fetch_latency_ms_bucket{le=\"+Inf\"} 3\n"), std::string::npos);
  EXPECT_NE(out.find("rulemerge_fetch_latency_ms_count 3\n"), std::string::npos);
}

// =============================================================================
// File Helpers
// =============================================================================

class FileHelpersTest : public ::testing::Test {
 protected:
  TempDir dir_;
};

TEST_F(FileHelpersTest, WriteFileAtomicCreatesParents) {
  std::string path = (dir_.path() / "nested" / "deeper" / "final_reject.yaml").string();
  std::string error;
  ASSERT_TRUE(WriteFileAtomic(path, "payload:\n", &error)) << error;
  EXPECT_EQ(dir_.ReadFile("nested/deeper/final_reject.yaml"), "payload:\n");
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(FileHelpersTest, WriteFileAtomicReplaces) {
  std::string path = dir_.WriteFile("out.yaml", "old contents that are longer\n");
  ASSERT_TRUE(WriteFileAtomic(path, "new\n", nullptr));
  EXPECT_EQ(dir_.ReadFile("out.yaml"), "new\n");
}

TEST_F(FileHelpersTest, WriteFileAtomicReportsFailure) {
  dir_.WriteFile("file", "x");
  std::string error;
  EXPECT_FALSE(WriteFileAtomic((dir_.path() / "file" / "out.yaml").string(), "y", &error));
  EXPECT_FALSE(error.empty());
}

TEST_F(FileHelpersTest, ReadLines) {
  std::string path = dir_.WriteFile("rules.txt", "DOMAIN,a.com\r\n\nb.com");
  auto lines = ReadLines(path);
  ASSERT_TRUE(lines.has_value());
  std::vector<std::string> expected = {"DOMAIN,a.com\r", "", "b.com"};
  EXPECT_EQ(*lines, expected);

  EXPECT_FALSE(ReadLines(dir_.string() + "/missing.txt").has_value());
  EXPECT_FALSE(ReadLines(dir_.string()).has_value());
  EXPECT_TRUE(FileExists(path));
}

}  // namespace
}  // namespace rulemerge
