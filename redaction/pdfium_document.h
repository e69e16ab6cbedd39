#pragma once

#include "redaction/document_io.h"

namespace dlpgate {

// Opens PDFs with PDFium. Pages render onto white with annotations drawn;
// interactive form fields are not rendered.
class PdfiumRasterizer : public PageRasterizer {
 public:
  std::unique_ptr<RasterDocument> Open(const std::vector<uint8_t>& document,
                                       std::string* error) const override;
};

// Builds a PDF with PDFium, one page per bitmap. Each page is the bitmap's
// size in points at `dpi` (pixels * 72 / dpi) and is covered by the bitmap.
class PdfiumAssembler : public DocumentAssembler {
 public:
  bool Assemble(const std::vector<Bitmap>& pages, int dpi, std::vector<uint8_t>* output,
                std::string* error) const override;
};

}  // namespace dlpgate
