#include "redaction/pdfium_document.h"

#include "redaction/pdfium_library.h"
#include "server/logging/logger.h"

#include <fpdf_edit.h>
#include <fpdf_save.h>

#include <climits>
#include <cmath>
#include <new>
#include <utility>

namespace dlpgate {

namespace {

class PdfiumRasterDocument : public RasterDocument {
 public:
  explicit PdfiumRasterDocument(ScopedPdfiumDocument document)
      : document_(std::move(document)) {
    PdfiumGuard guard(PdfiumMutex());
    int count = FPDF_GetPageCount(document_.get());
    page_count_ = count > 0 ? static_cast<std::size_t>(count) : 0;
  }

  std::size_t PageCount() const override { return page_count_; }

  bool RenderPage(std::size_t index, int scale, Bitmap* page,
                  std::string* error) const override {
    if (!page) {
      if (error) *error = "output bitmap is null";
      return false;
    }
    if (index >= page_count_) {
      if (error) {
        *error = "page " + std::to_string(index) + " out of range (" +
                 std::to_string(page_count_) + " pages)";
      }
      return false;
    }
    if (scale <= 0) {
      if (error) *error = "render scale must be positive";
      return false;
    }

    PdfiumGuard guard(PdfiumMutex());
    ScopedPdfiumPage handle(FPDF_LoadPage(document_.get(), static_cast<int>(index)));
    if (!handle) {
      if (error) *error = "cannot load page: " + PdfiumErrorText(FPDF_GetLastError());
      return false;
    }
    const double width = std::round(FPDF_GetPageWidthF(handle.get()) * scale);
    const double height = std::round(FPDF_GetPageHeightF(handle.get()) * scale);
    if (width < 1 || height < 1 || width > INT_MAX || height > INT_MAX) {
      if (error) *error = "page has no drawable area";
      return false;
    }
    const int w = static_cast<int>(width);
    const int h = static_cast<int>(height);
    Bitmap rendered(w, h, PixelFormat::kBgrx);
    if (!rendered.Valid()) {
      if (error) *error = "cannot allocate " + std::to_string(w) + "x" + std::to_string(h) + " bitmap";
      return false;
    }
    FPDFBitmap_FillRect(rendered.get(), 0, 0, w, h, 0xFFFFFFFF);
    FPDF_RenderPageBitmap(rendered.get(), handle.get(), 0, 0, w, h, 0, FPDF_ANNOT);
    *page = std::move(rendered);
    return true;
  }

 private:
  ScopedPdfiumDocument document_;
  std::size_t page_count_{0};
};

// FPDF_FILEWRITE sink appending to a byte vector.
struct BufferWriter : FPDF_FILEWRITE {
  explicit BufferWriter(std::vector<uint8_t>* out) : bytes(out) {
    version = 1;
    WriteBlock = &BufferWriter::Append;
  }

  static int Append(FPDF_FILEWRITE* self, const void* data, unsigned long size) {
    auto* writer = static_cast<BufferWriter*>(self);
    const auto* begin = static_cast<const uint8_t*>(data);
    try {
      writer->bytes->insert(writer->bytes->end(), begin, begin + size);
    } catch (const std::bad_alloc&) {
      return 0;
    }
    return 1;
  }

  std::vector<uint8_t>* bytes;
};

// Caller holds the PDFium lock.
bool AddImagePage(FPDF_DOCUMENT document, int index, const Bitmap& bitmap, int dpi,
                  std::string* error) {
  const double width = bitmap.width() * 72.0 / dpi;
  const double height = bitmap.height() * 72.0 / dpi;
  ScopedPdfiumPage page(FPDFPage_New(document, index, width, height));
  if (!page) {
    *error = "cannot create page";
    return false;
  }
  FPDF_PAGEOBJECT image = FPDFPageObj_NewImageObj(document);
  if (!image) {
    *error = "cannot create image object";
    return false;
  }
  FPDF_PAGE pages[] = {page.get()};
  FS_MATRIX placement{static_cast<float>(width), 0, 0, static_cast<float>(height), 0, 0};
  if (!FPDFImageObj_SetBitmap(pages, 1, image, bitmap.get()) ||
      !FPDFPageObj_SetMatrix(image, &placement)) {
    FPDFPageObj_Destroy(image);
    *error = "cannot attach page image";
    return false;
  }
  // The page owns the image from here on.
  FPDFPage_InsertObject(page.get(), image);
  if (!FPDFPage_GenerateContent(page.get())) {
    *error = "cannot generate page content";
    return false;
  }
  return true;
}

}  // namespace

std::unique_ptr<RasterDocument> PdfiumRasterizer::Open(const std::vector<uint8_t>& document,
                                                       std::string* error) const {
  if (document.empty()) {
    if (error) *error = "document is empty";
    return nullptr;
  }
  if (document.size() > static_cast<std::size_t>(INT_MAX)) {
    if (error) *error = "document is too large";
    return nullptr;
  }
  EnsurePdfiumInitialized();
  PdfiumGuard guard(PdfiumMutex());
  ScopedPdfiumDocument handle(
      FPDF_LoadMemDocument(document.data(), static_cast<int>(document.size()), nullptr));
  if (!handle) {
    if (error) *error = "cannot open document: " + PdfiumErrorText(FPDF_GetLastError());
    return nullptr;
  }
  return std::make_unique<PdfiumRasterDocument>(std::move(handle));
}

bool PdfiumAssembler::Assemble(const std::vector<Bitmap>& pages, int dpi,
                               std::vector<uint8_t>* output, std::string* error) const {
  if (!output) {
    if (error) *error = "output buffer is null";
    return false;
  }
  if (pages.empty()) {
    if (error) *error = "no pages to assemble";
    return false;
  }
  if (dpi <= 0) {
    if (error) *error = "dpi must be positive";
    return false;
  }

  EnsurePdfiumInitialized();
  PdfiumGuard guard(PdfiumMutex());
  ScopedPdfiumDocument document(FPDF_CreateNewDocument());
  if (!document) {
    if (error) *error = "cannot create document";
    return false;
  }
  for (std::size_t i = 0; i < pages.size(); ++i) {
    std::string page_error = "not a valid bitmap";
    if (!pages[i].Valid() ||
        !AddImagePage(document.get(), static_cast<int>(i), pages[i], dpi, &page_error)) {
      if (error) *error = "page " + std::to_string(i) + ": " + page_error;
      return false;
    }
  }

  std::vector<uint8_t> bytes;
  BufferWriter writer(&bytes);
  if (!FPDF_SaveAsCopy(document.get(), &writer, 0)) {
    if (error) *error = "cannot serialize document";
    return false;
  }
  log::Debug("document", "assembled pdf",
             "pages=" + std::to_string(pages.size()) + " bytes=" + std::to_string(bytes.size()));
  *output = std::move(bytes);
  return true;
}

}  // namespace dlpgate
