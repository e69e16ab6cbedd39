#pragma once

#include "detection/match.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dlpgate {

// Detector interfaces consumed by the decision engine and the document
// pipeline. Recognizers (NER, OCR, pattern libraries) live behind these.
//
// Contract for every implementation:
//   - Detect() never throws; on internal failure it logs and returns an empty
//     map. Callers still guard against std::exception as a second line.
//   - Detect() is safe to call concurrently; handles are initialized once and
//     never mutated afterwards.

class TextDetector {
 public:
  virtual ~TextDetector() = default;

  // Matches carry MatchOrigin::kText byte offsets into `text`.
  virtual DetectionMap Detect(const std::string& text) const = 0;

  virtual std::string Name() const = 0;
};

class ImageDetector {
 public:
  virtual ~ImageDetector() = default;

  // `image` holds encoded bytes (PNG, JPEG, ...). Matches carry
  // MatchOrigin::kImage.
  virtual DetectionMap Detect(const std::vector<uint8_t>& image) const = 0;

  virtual std::string Name() const = 0;
};

// Combined text + image detection over a whole paginated document.
class DocumentDetector {
 public:
  virtual ~DocumentDetector() = default;

  virtual DetectionMap Detect(const std::vector<uint8_t>& document) const = 0;

  virtual std::string Name() const = 0;
};

}  // namespace dlpgate
