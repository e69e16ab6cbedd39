#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace dlpgate {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 1, 5, 10, 25, 50, 100, 250, 1000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      1.0, 5.0, 10.0, 25.0, 50.0, 100.0, 250.0, 1000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

// Decision outcomes: "allow", "mask", "warn", "observe", "block".
// Page results: "redacted", "unredacted", "dropped".
// Document results: "unchanged", "redacted", "fallback".
class MetricsRegistry {
public:
  void RecordRequest();
  void RecordDecision(const std::string &outcome);
  void RecordDetections(const std::string &category, std::size_t count);
  void RecordHookError();
  void RecordDocumentPage(const std::string &result);
  void RecordDocument(const std::string &result);
  void RecordEvaluationLatency(double ms);

  uint64_t Requests() const;
  uint64_t HookErrors() const;
  uint64_t Decisions(const std::string &outcome) const;
  uint64_t Detections(const std::string &category) const;
  uint64_t DocumentPages(const std::string &result) const;
  uint64_t Documents(const std::string &result) const;

  std::string RenderPrometheus() const;

private:
  static void Increment(std::mutex &mutex, std::map<std::string, uint64_t> &counts,
                        const std::string &label, uint64_t by);
  static uint64_t Lookup(std::mutex &mutex, const std::map<std::string, uint64_t> &counts,
                         const std::string &label);

  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> hook_errors_{0};

  // Labelled counters, ordered for stable exposition.
  mutable std::mutex decisions_mutex_;
  std::map<std::string, uint64_t> decisions_;
  mutable std::mutex detections_mutex_;
  std::map<std::string, uint64_t> detections_;
  mutable std::mutex documents_mutex_;
  std::map<std::string, uint64_t> document_pages_;
  std::map<std::string, uint64_t> documents_;

  LatencyHistogram evaluation_latency_;
};

MetricsRegistry &GlobalMetrics();

} // namespace dlpgate
