#pragma once

#include "detection/detector.h"
#include "redaction/document_io.h"
#include "redaction/pdfium_document.h"
#include "redaction/region_redactor.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dlpgate {

// Render -> redact -> stitch for paginated documents.
//
// A document without detections is returned byte for byte. Otherwise every
// page is rasterized at 216 DPI, redacted and reassembled in page order. A
// page that fails to redact is kept unredacted; a page that fails to render is
// dropped. If no page survives, or anything else fails, the original bytes
// are returned.
class DocumentRedactionPipeline {
 public:
  static constexpr int kRenderScale = 3;
  static constexpr int kRenderDpi = 72 * kRenderScale;

  DocumentRedactionPipeline(std::shared_ptr<const DocumentDetector> detector,
                            std::shared_ptr<const PageRasterizer> rasterizer,
                            std::shared_ptr<const ImageRedactor> redactor,
                            std::shared_ptr<const DocumentAssembler> assembler =
                                std::make_shared<PdfiumAssembler>());

  std::vector<uint8_t> RedactDocument(const std::vector<uint8_t>& document) const;

 private:
  bool RedactPages(const std::vector<uint8_t>& document, std::vector<uint8_t>* output,
                   std::string* error) const;
  // Returns false when the page must be dropped.
  bool RenderAndRedactPage(const RasterDocument& document, std::size_t index,
                           Bitmap* page) const;

  std::shared_ptr<const DocumentDetector> detector_;
  std::shared_ptr<const PageRasterizer> rasterizer_;
  std::shared_ptr<const ImageRedactor> redactor_;
  std::shared_ptr<const DocumentAssembler> assembler_;
};

}  // namespace dlpgate
