#pragma once

#include "redaction/bitmap.h"

#include <memory>
#include <string>
#include <vector>

namespace dlpgate {

// Per-page image redaction seam of the document pipeline.
class ImageRedactor {
 public:
  virtual ~ImageRedactor() = default;
  // Writes the redacted copy of `page` to *output. Returns false (and sets
  // *error) if the page could not be redacted; *output is then unspecified.
  virtual bool Redact(const Bitmap& page, Bitmap* output, std::string* error) const = 0;
};

// Finds the pixel boxes holding sensitive data on an image (OCR plus
// detection). Implemented outside this repository.
class RegionLocator {
 public:
  virtual ~RegionLocator() = default;
  virtual bool Locate(const Bitmap& image, std::vector<PixelBox>* boxes,
                      std::string* error) const = 0;
};

// Paints every located box with an opaque fill.
class FillRegionRedactor : public ImageRedactor {
 public:
  explicit FillRegionRedactor(std::shared_ptr<const RegionLocator> locator,
                              Rgb fill = Rgb{0, 0, 0});

  bool Redact(const Bitmap& page, Bitmap* output, std::string* error) const override;

 private:
  std::shared_ptr<const RegionLocator> locator_;
  Rgb fill_;
};

}  // namespace dlpgate
