#pragma once

#include "detection/match.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace dlpgate {

struct RedactionOutcome {
  std::string redacted_text;
  // Original matched texts per category, never the placeholders.
  std::map<std::string, std::vector<std::string>> redacted_items;
};

// A byte range of the text that will be replaced by one placeholder.
struct RedactionSpan {
  std::size_t start{0};
  std::size_t end{0};
  std::string category;
};

// "[REDACTED_<CATEGORY>]" with the category upper-cased.
std::string PlaceholderFor(const std::string& category);

// Turns the kText matches of `detections` into disjoint spans, sorted by
// start. Overlapping matches are merged into their union so no matched byte
// survives; the union is labelled with the category of its highest-ranked
// member (longest match, then earliest, then lexically smallest category).
// Matches from other coordinate spaces, empty matches and out-of-range
// matches produce no span.
std::vector<RedactionSpan> ResolveSpans(const std::string& text, const DetectionMap& detections);

// Replaces each span (disjoint, sorted by start, within `text`) with its
// placeholder, right to left so pending offsets stay valid.
std::string ApplySpans(const std::string& text, const std::vector<RedactionSpan>& spans);

// ResolveSpans + ApplySpans. Every category with at least one match is listed
// in redacted_items, whether or not its spans could be applied.
RedactionOutcome Redact(const std::string& text, const DetectionMap& detections);

}  // namespace dlpgate
