#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rulemerge {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., sources fetched, fetch failures). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., fetch latency in milliseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., entries emitted per category).
   *  Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/**
 * Prometheus-compatible metrics sink.
 *
 * Names may carry a label set ("rulemerge_entries{category=\"reject\"}");
 * series sharing a base name are grouped under one TYPE line. Export() output
 * is meant for the node-exporter textfile collector.
 */
class PrometheusMetrics : public MetricsSink {
 public:
  PrometheusMetrics() = default;

  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /** Prometheus text exposition format, series sorted by name. */
  std::string Export() const;

  /**
   * Write Export() to `path` through a temporary sibling file.
   * Returns false and fills *error on I/O failure.
   */
  bool WriteTextfile(const std::string& path, std::string* error) const;

 private:
  struct HistogramData {
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    double sum = 0.0;
  };

  mutable std::mutex mu_;
  std::map<std::string, uint64_t> counters_;
  std::map<std::string, HistogramData> histograms_;
  std::map<std::string, double> gauges_;
};

/** `base{category="name"}` */
std::string CategoryMetric(std::string_view base, std::string_view category);

}  // namespace rulemerge
