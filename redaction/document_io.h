#pragma once

#include "redaction/bitmap.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dlpgate {

// A paginated document opened for rendering.
class RasterDocument {
 public:
  virtual ~RasterDocument() = default;
  virtual std::size_t PageCount() const = 0;
  // Renders page `index` at `scale` x 72 DPI.
  virtual bool RenderPage(std::size_t index, int scale, Bitmap* page,
                          std::string* error) const = 0;
};

// Render phase of the document pipeline.
class PageRasterizer {
 public:
  virtual ~PageRasterizer() = default;
  // `document` must outlive the returned handle. Returns null and sets
  // *error when the document cannot be opened.
  virtual std::unique_ptr<RasterDocument> Open(const std::vector<uint8_t>& document,
                                               std::string* error) const = 0;
};

// Stitch phase of the document pipeline: rendered pages, in order, to one
// document. `dpi` is the resolution the pages were rendered at.
class DocumentAssembler {
 public:
  virtual ~DocumentAssembler() = default;
  virtual bool Assemble(const std::vector<Bitmap>& pages, int dpi, std::vector<uint8_t>* output,
                        std::string* error) const = 0;
};

}  // namespace dlpgate
