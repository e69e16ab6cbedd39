#include "redaction/document_pipeline.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <exception>
#include <utility>

namespace dlpgate {

DocumentRedactionPipeline::DocumentRedactionPipeline(
    std::shared_ptr<const DocumentDetector> detector,
    std::shared_ptr<const PageRasterizer> rasterizer,
    std::shared_ptr<const ImageRedactor> redactor,
    std::shared_ptr<const DocumentAssembler> assembler)
    : detector_(std::move(detector)),
      rasterizer_(std::move(rasterizer)),
      redactor_(std::move(redactor)),
      assembler_(std::move(assembler)) {}

std::vector<uint8_t> DocumentRedactionPipeline::RedactDocument(
    const std::vector<uint8_t>& document) const {
  try {
    DetectionMap detections;
    if (detector_) {
      detections = detector_->Detect(document);
    }
    std::size_t total = CountMatches(detections);
    if (total == 0) {
      GlobalMetrics().RecordDocument("unchanged");
      return document;
    }
    log::Info("document", "redacting document",
              "bytes=" + std::to_string(document.size()) + " matches=" + std::to_string(total));

    std::vector<uint8_t> output;
    std::string error;
    if (RedactPages(document, &output, &error)) {
      GlobalMetrics().RecordDocument("redacted");
      return output;
    }
    log::Error("document", "document redaction failed, returning original", error);
  } catch (const std::exception& e) {
    log::Error("document", "document redaction failed, returning original",
               std::string("error=") + e.what());
  }
  GlobalMetrics().RecordDocument("fallback");
  return document;
}

bool DocumentRedactionPipeline::RedactPages(const std::vector<uint8_t>& document,
                                            std::vector<uint8_t>* output,
                                            std::string* error) const {
  if (!rasterizer_ || !redactor_ || !assembler_) {
    *error = "pipeline is missing a rasterizer, redactor or assembler";
    return false;
  }
  std::string open_error;
  auto opened = rasterizer_->Open(document, &open_error);
  if (!opened) {
    *error = "cannot open document: " + open_error;
    return false;
  }
  const std::size_t count = opened->PageCount();

  std::vector<Bitmap> pages;
  pages.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    Bitmap page;
    if (RenderAndRedactPage(*opened, i, &page)) {
      pages.push_back(std::move(page));
    }
  }
  if (pages.empty()) {
    *error = "no page of " + std::to_string(count) + " could be rendered";
    return false;
  }

  std::string assemble_error;
  if (!assembler_->Assemble(pages, kRenderDpi, output, &assemble_error)) {
    *error = "cannot assemble redacted pages: " + assemble_error;
    return false;
  }
  log::Info("document", "document redacted",
            "pages=" + std::to_string(pages.size()) + "/" + std::to_string(count));
  return true;
}

bool DocumentRedactionPipeline::RenderAndRedactPage(const RasterDocument& document,
                                                    std::size_t index, Bitmap* page) const {
  const std::string page_field = "page=" + std::to_string(index);
  Bitmap rendered;
  std::string error;
  bool ok = false;
  try {
    ok = document.RenderPage(index, kRenderScale, &rendered, &error);
    if (ok && !rendered.Valid()) {
      ok = false;
      error = "rasterizer returned an empty bitmap";
    }
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!ok) {
    log::Error("document", "page dropped: render failed", page_field + " error=" + error);
    GlobalMetrics().RecordDocumentPage("dropped");
    return false;
  }

  error.clear();
  ok = false;
  try {
    ok = redactor_->Redact(rendered, page, &error);
    if (ok && !page->Valid()) {
      ok = false;
      error = "redactor returned an empty bitmap";
    }
  } catch (const std::exception& e) {
    error = e.what();
  }
  if (!ok) {
    log::Warn("document", "page kept UNREDACTED: redaction failed",
              page_field + " error=" + error);
    GlobalMetrics().RecordDocumentPage("unredacted");
    *page = std::move(rendered);
    return true;
  }
  GlobalMetrics().RecordDocumentPage("redacted");
  return true;
}

}  // namespace dlpgate
