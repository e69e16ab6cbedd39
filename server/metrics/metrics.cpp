#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dlpgate {

namespace {
MetricsRegistry g_metrics;

void RenderLabelled(std::ostringstream &out, const std::string &name, const std::string &help,
                    const std::string &label, const std::map<std::string, uint64_t> &counts) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " counter\n";
  for (const auto &[value, count] : counts) {
    out << name << "{" << label << "=\"" << value << "\"} " << count << "\n";
  }
}
}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::Increment(std::mutex &mutex, std::map<std::string, uint64_t> &counts,
                                const std::string &label, uint64_t by) {
  std::lock_guard<std::mutex> lock(mutex);
  counts[label] += by;
}

uint64_t MetricsRegistry::Lookup(std::mutex &mutex, const std::map<std::string, uint64_t> &counts,
                                 const std::string &label) {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = counts.find(label);
  return it == counts.end() ? 0 : it->second;
}

void MetricsRegistry::RecordRequest() {
  total_requests_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordDecision(const std::string &outcome) {
  Increment(decisions_mutex_, decisions_, outcome, 1);
}

void MetricsRegistry::RecordDetections(const std::string &category, std::size_t count) {
  if (count == 0) {
    return;
  }
  Increment(detections_mutex_, detections_, category, count);
}

void MetricsRegistry::RecordHookError() {
  hook_errors_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordDocumentPage(const std::string &result) {
  Increment(documents_mutex_, document_pages_, result, 1);
}

void MetricsRegistry::RecordDocument(const std::string &result) {
  Increment(documents_mutex_, documents_, result, 1);
}

void MetricsRegistry::RecordEvaluationLatency(double ms) { evaluation_latency_.Record(ms); }

uint64_t MetricsRegistry::Requests() const { return total_requests_.load(); }

uint64_t MetricsRegistry::HookErrors() const { return hook_errors_.load(); }

uint64_t MetricsRegistry::Decisions(const std::string &outcome) const {
  return Lookup(decisions_mutex_, decisions_, outcome);
}

uint64_t MetricsRegistry::Detections(const std::string &category) const {
  return Lookup(detections_mutex_, detections_, category);
}

uint64_t MetricsRegistry::DocumentPages(const std::string &result) const {
  return Lookup(documents_mutex_, document_pages_, result);
}

uint64_t MetricsRegistry::Documents(const std::string &result) const {
  return Lookup(documents_mutex_, documents_, result);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  // --- Counters ---
  out << "# HELP dlpgate_requests_total Requests inspected by the pre-call hook\n";
  out << "# TYPE dlpgate_requests_total counter\n";
  out << "dlpgate_requests_total " << total_requests_.load() << "\n";

  out << "# HELP dlpgate_hook_errors_total Hook failures that fell back to the original request\n";
  out << "# TYPE dlpgate_hook_errors_total counter\n";
  out << "dlpgate_hook_errors_total " << hook_errors_.load() << "\n";

  {
    std::lock_guard<std::mutex> lock(decisions_mutex_);
    RenderLabelled(out, "dlpgate_decisions_total", "Decisions by outcome", "outcome",
                   decisions_);
  }
  {
    std::lock_guard<std::mutex> lock(detections_mutex_);
    RenderLabelled(out, "dlpgate_detections_total", "Sensitive-data matches by category",
                   "category", detections_);
  }
  {
    std::lock_guard<std::mutex> lock(documents_mutex_);
    RenderLabelled(out, "dlpgate_document_pages_total", "Document pages by redaction result",
                   "result", document_pages_);
    RenderLabelled(out, "dlpgate_documents_total", "Documents by pipeline result", "result",
                   documents_);
  }

  // --- Evaluation latency histogram ---
  out << "# HELP dlpgate_evaluation_duration_ms Time to evaluate one request\n";
  out << "# TYPE dlpgate_evaluation_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "dlpgate_evaluation_duration_ms_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << evaluation_latency_.counts[i].load()
        << "\n";
  }
  out << "dlpgate_evaluation_duration_ms_bucket{le=\"+Inf\"} "
      << evaluation_latency_.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << "dlpgate_evaluation_duration_ms_sum " << evaluation_latency_.sum_ms.load() << "\n";
  out << "dlpgate_evaluation_duration_ms_count " << evaluation_latency_.total.load() << "\n";

  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace dlpgate
