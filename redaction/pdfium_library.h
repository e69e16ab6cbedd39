#pragma once

#include <fpdfview.h>

#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace dlpgate {

// Initializes PDFium once per process. The library stays loaded until exit.
void EnsurePdfiumInitialized();

// PDFium is not thread-safe. Document, page and bitmap calls hold this lock;
// it is recursive so bitmap helpers can run under an outer guard.
std::recursive_mutex& PdfiumMutex();
using PdfiumGuard = std::lock_guard<std::recursive_mutex>;

// Human-readable text for an FPDF_GetLastError() code.
std::string PdfiumErrorText(unsigned long code);

struct PdfiumDocumentCloser {
  void operator()(FPDF_DOCUMENT document) const;
};

struct PdfiumPageCloser {
  void operator()(FPDF_PAGE page) const;
};

using ScopedPdfiumDocument =
    std::unique_ptr<std::remove_pointer<FPDF_DOCUMENT>::type, PdfiumDocumentCloser>;
using ScopedPdfiumPage = std::unique_ptr<std::remove_pointer<FPDF_PAGE>::type, PdfiumPageCloser>;

}  // namespace dlpgate
