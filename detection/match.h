#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace dlpgate {

// Coordinate space a match's offsets refer to.
enum class MatchOrigin {
  kText,      // Byte offsets into the request text blob.
  kImage,     // Opaque; owned by the image detector (OCR text positions).
  kDocument,  // Opaque; owned by the document detector.
};

// One located occurrence of a sensitive-data category.
// For kText matches: start <= end <= blob.size() and
// blob.substr(start, end - start) == text.
struct Match {
  std::string text;
  std::size_t start{0};
  std::size_t end{0};
  MatchOrigin origin{MatchOrigin::kText};

  Match() = default;
  Match(std::string text_in, std::size_t start_in, std::size_t end_in,
        MatchOrigin origin_in = MatchOrigin::kText)
      : text(std::move(text_in)),
        start(start_in),
        end(end_in),
        origin(origin_in) {}

  bool operator==(const Match& other) const {
    return text == other.text && start == other.start && end == other.end &&
           origin == other.origin;
  }
};

// Category tag (e.g. "email", "credit_card") -> occurrences.
using DetectionMap = std::map<std::string, std::vector<Match>>;

// Appends every match in `from` to the same category in `into`.
void MergeDetections(DetectionMap* into, const DetectionMap& from);

// Keeps only categories present in `enabled`. Empty categories are dropped too.
DetectionMap FilterDetections(const DetectionMap& detections,
                              const std::set<std::string>& enabled);

std::size_t CountMatches(const DetectionMap& detections);

// Literal matched texts of one category, in detection order.
std::vector<std::string> MatchedTexts(const std::vector<Match>& matches);

const char* MatchOriginName(MatchOrigin origin);

}  // namespace dlpgate
