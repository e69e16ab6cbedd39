#include "detection/match.h"

namespace dlpgate {

void MergeDetections(DetectionMap* into, const DetectionMap& from) {
  if (!into) {
    return;
  }
  for (const auto& [category, matches] : from) {
    if (matches.empty()) {
      continue;
    }
    auto& target = (*into)[category];
    target.insert(target.end(), matches.begin(), matches.end());
  }
}

DetectionMap FilterDetections(const DetectionMap& detections,
                              const std::set<std::string>& enabled) {
  DetectionMap filtered;
  for (const auto& [category, matches] : detections) {
    if (matches.empty() || enabled.count(category) == 0) {
      continue;
    }
    filtered.emplace(category, matches);
  }
  return filtered;
}

std::size_t CountMatches(const DetectionMap& detections) {
  std::size_t total = 0;
  for (const auto& entry : detections) {
    total += entry.second.size();
  }
  return total;
}

std::vector<std::string> MatchedTexts(const std::vector<Match>& matches) {
  std::vector<std::string> texts;
  texts.reserve(matches.size());
  for (const auto& match : matches) {
    texts.push_back(match.text);
  }
  return texts;
}

const char* MatchOriginName(MatchOrigin origin) {
  switch (origin) {
  case MatchOrigin::kText:
    return "text";
  case MatchOrigin::kImage:
    return "image";
  case MatchOrigin::kDocument:
    return "document";
  }
  return "unknown";
}

}  // namespace dlpgate
