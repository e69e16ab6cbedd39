#include "redaction/pdfium_library.h"

#include "server/logging/logger.h"

namespace dlpgate {

void EnsurePdfiumInitialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    FPDF_LIBRARY_CONFIG config{};
    config.version = 2;
    FPDF_InitLibraryWithConfig(&config);
    log::Debug("pdfium", "library initialized");
  });
}

std::recursive_mutex& PdfiumMutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

std::string PdfiumErrorText(unsigned long code) {
  switch (code) {
    case FPDF_ERR_SUCCESS:
      return "no error";
    case FPDF_ERR_UNKNOWN:
      return "unknown error";
    case FPDF_ERR_FILE:
      return "file not found or could not be opened";
    case FPDF_ERR_FORMAT:
      return "not a PDF or corrupted";
    case FPDF_ERR_PASSWORD:
      return "password required or incorrect";
    case FPDF_ERR_SECURITY:
      return "unsupported security scheme";
    case FPDF_ERR_PAGE:
      return "page not found or content error";
  }
  return "pdfium error " + std::to_string(code);
}

void PdfiumDocumentCloser::operator()(FPDF_DOCUMENT document) const {
  PdfiumGuard guard(PdfiumMutex());
  FPDF_CloseDocument(document);
}

void PdfiumPageCloser::operator()(FPDF_PAGE page) const {
  PdfiumGuard guard(PdfiumMutex());
  FPDF_ClosePage(page);
}

}  // namespace dlpgate
