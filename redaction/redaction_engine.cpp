#include "redaction/redaction_engine.h"

#include "server/logging/logger.h"

#include <algorithm>
#include <cctype>

namespace dlpgate {

namespace {

struct Candidate {
  const std::string* category;
  const Match* match;
};

std::size_t Length(const Candidate& c) { return c.match->end - c.match->start; }

// Ranking used to label a merged span.
bool Outranks(const Candidate& a, const Candidate& b) {
  if (Length(a) != Length(b)) return Length(a) > Length(b);
  if (a.match->start != b.match->start) return a.match->start < b.match->start;
  return *a.category < *b.category;
}

std::vector<Candidate> CollectCandidates(const std::string& text,
                                         const DetectionMap& detections) {
  std::vector<Candidate> candidates;
  for (const auto& [category, matches] : detections) {
    for (const auto& match : matches) {
      if (match.origin != MatchOrigin::kText) {
        continue;
      }
      if (match.start > match.end || match.end > text.size()) {
        log::Warn("redaction", "skipping out-of-range match",
                  "category=" + category + " start=" + std::to_string(match.start) +
                      " end=" + std::to_string(match.end) +
                      " text_size=" + std::to_string(text.size()));
        continue;
      }
      if (match.start == match.end) {
        continue;
      }
      candidates.push_back({&category, &match});
    }
  }
  return candidates;
}

}  // namespace

std::string PlaceholderFor(const std::string& category) {
  std::string upper = category;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return "[REDACTED_" + upper + "]";
}

std::vector<RedactionSpan> ResolveSpans(const std::string& text, const DetectionMap& detections) {
  auto candidates = CollectCandidates(text, detections);
  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.match->start != b.match->start) return a.match->start < b.match->start;
    return a.match->end > b.match->end;
  });

  std::vector<RedactionSpan> spans;
  const Candidate* best = nullptr;
  for (const auto& candidate : candidates) {
    if (!spans.empty() && candidate.match->start < spans.back().end) {
      auto& merged = spans.back();
      if (candidate.match->end > merged.end) {
        log::Debug("redaction", "merging overlapping matches",
                   "category=" + *candidate.category + " with=" + merged.category +
                       " start=" + std::to_string(merged.start) +
                       " end=" + std::to_string(candidate.match->end));
        merged.end = candidate.match->end;
      }
      if (Outranks(candidate, *best)) {
        best = &candidate;
        merged.category = *candidate.category;
      }
      continue;
    }
    spans.push_back({candidate.match->start, candidate.match->end, *candidate.category});
    best = &candidate;
  }
  return spans;
}

std::string ApplySpans(const std::string& text, const std::vector<RedactionSpan>& spans) {
  std::string out = text;
  for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
    if (it->start >= it->end || it->end > out.size()) {
      continue;
    }
    out.replace(it->start, it->end - it->start, PlaceholderFor(it->category));
  }
  return out;
}

RedactionOutcome Redact(const std::string& text, const DetectionMap& detections) {
  RedactionOutcome outcome;
  for (const auto& [category, matches] : detections) {
    if (!matches.empty()) {
      outcome.redacted_items[category] = MatchedTexts(matches);
    }
  }
  outcome.redacted_text = ApplySpans(text, ResolveSpans(text, detections));
  return outcome;
}

}  // namespace dlpgate
