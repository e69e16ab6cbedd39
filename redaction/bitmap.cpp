#include "redaction/bitmap.h"

#include "redaction/pdfium_library.h"

#include <algorithm>
#include <cstring>

namespace dlpgate {

const char* PixelFormatName(PixelFormat format) {
  switch (format) {
    case PixelFormat::kUnknown:
      return "unknown";
    case PixelFormat::kGray:
      return "gray";
    case PixelFormat::kBgr:
      return "bgr";
    case PixelFormat::kBgrx:
      return "bgrx";
    case PixelFormat::kBgra:
      return "bgra";
  }
  return "unknown";
}

void Bitmap::Deleter::operator()(FPDF_BITMAP bitmap) const {
  PdfiumGuard guard(PdfiumMutex());
  FPDFBitmap_Destroy(bitmap);
}

Bitmap::Bitmap(int width, int height, PixelFormat format) {
  if (width <= 0 || height <= 0 || format == PixelFormat::kUnknown) {
    return;
  }
  EnsurePdfiumInitialized();
  PdfiumGuard guard(PdfiumMutex());
  handle_.reset(FPDFBitmap_CreateEx(width, height, static_cast<int>(format), nullptr, 0));
}

Bitmap::Bitmap(FPDF_BITMAP handle) : handle_(handle) {}

int Bitmap::width() const { return handle_ ? FPDFBitmap_GetWidth(handle_.get()) : 0; }

int Bitmap::height() const { return handle_ ? FPDFBitmap_GetHeight(handle_.get()) : 0; }

int Bitmap::stride() const { return handle_ ? FPDFBitmap_GetStride(handle_.get()) : 0; }

PixelFormat Bitmap::format() const {
  return handle_ ? static_cast<PixelFormat>(FPDFBitmap_GetFormat(handle_.get()))
                 : PixelFormat::kUnknown;
}

uint8_t* Bitmap::buffer() {
  return handle_ ? static_cast<uint8_t*>(FPDFBitmap_GetBuffer(handle_.get())) : nullptr;
}

const uint8_t* Bitmap::buffer() const {
  return handle_ ? static_cast<const uint8_t*>(FPDFBitmap_GetBuffer(handle_.get())) : nullptr;
}

Bitmap Bitmap::Clone() const {
  if (!Valid()) {
    return Bitmap();
  }
  Bitmap copy(width(), height(), format());
  if (!copy.Valid()) {
    return copy;
  }
  const std::size_t row = static_cast<std::size_t>(std::min(stride(), copy.stride()));
  for (int y = 0; y < height(); ++y) {
    std::memcpy(copy.buffer() + static_cast<std::size_t>(y) * copy.stride(),
                buffer() + static_cast<std::size_t>(y) * stride(), row);
  }
  return copy;
}

std::size_t FillRect(Bitmap* image, const PixelBox& box, const Rgb& colour) {
  if (!image || !image->Valid() || box.width <= 0 || box.height <= 0) {
    return 0;
  }
  // Clip in 64-bit so boxes near INT_MAX do not overflow.
  long long x0 = std::max<long long>(box.x, 0);
  long long y0 = std::max<long long>(box.y, 0);
  long long x1 = std::min<long long>(static_cast<long long>(box.x) + box.width, image->width());
  long long y1 = std::min<long long>(static_cast<long long>(box.y) + box.height, image->height());
  if (x0 >= x1 || y0 >= y1) {
    return 0;
  }
  const FPDF_DWORD argb = 0xFF000000u | (static_cast<FPDF_DWORD>(colour.r) << 16) |
                          (static_cast<FPDF_DWORD>(colour.g) << 8) | colour.b;
  PdfiumGuard guard(PdfiumMutex());
  FPDFBitmap_FillRect(image->get(), static_cast<int>(x0), static_cast<int>(y0),
                      static_cast<int>(x1 - x0), static_cast<int>(y1 - y0), argb);
  return static_cast<std::size_t>((x1 - x0) * (y1 - y0));
}

}  // namespace dlpgate
