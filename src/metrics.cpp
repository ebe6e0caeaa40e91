#include <rulemerge/metrics.hpp>
#include <rulemerge/io.hpp>

#include <set>
#include <sstream>

namespace rulemerge {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 30000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

std::string BaseName(const std::string& series) {
  return series.substr(0, series.find('{'));
}

template <typename Map>
void ExportScalars(std::ostringstream& out, const Map& series, const char* type) {
  std::set<std::string> typed;
  for (const auto& [name, value] : series) {
    std::string base = BaseName(name);
    if (typed.insert(base).second) {
      out << "# TYPE " << base << " " << type << "\n";
    }
    out << name << " " << value << "\n";
  }
}

}  // namespace

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[std::string(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& h = histograms_[std::string(name)];
  if (h.buckets.empty()) {
    h.buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(static_cast<double>(value), kLatencyBuckets);
  for (size_t i = bucket; i < h.buckets.size(); ++i) {
    h.buckets[i]++;
  }
  h.count++;
  h.sum += static_cast<double>(value);
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[std::string(name)] = value;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;

  ExportScalars(out, counters_, "counter");
  ExportScalars(out, gauges_, "gauge");

  for (const auto& [name, data] : histograms_) {
    out << "# TYPE " << name << " histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << kLatencyBuckets[i] << "\"} "
          << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  return out.str();
}

bool PrometheusMetrics::WriteTextfile(const std::string& path,
                                      std::string* error) const {
  return WriteFileAtomic(path, Export(), error);
}

std::string CategoryMetric(std::string_view base, std::string_view category) {
  std::string out(base);
  out += "{category=\"";
  out += category;
  out += "\"}";
  return out;
}

}  // namespace rulemerge
