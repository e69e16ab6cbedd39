#pragma once

#include <fpdfview.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

namespace dlpgate {

// PDFium bitmap layouts. Bytes inside a pixel are ordered B, G, R[, x|A].
enum class PixelFormat {
  kUnknown = FPDFBitmap_Unknown,
  kGray = FPDFBitmap_Gray,
  kBgr = FPDFBitmap_BGR,
  kBgrx = FPDFBitmap_BGRx,
  kBgra = FPDFBitmap_BGRA,
};

const char* PixelFormatName(PixelFormat format);

// Owning, move-only handle to a PDFium bitmap. Rows are stride() bytes apart.
class Bitmap {
 public:
  Bitmap() = default;
  // Allocates an uninitialized width x height bitmap. Valid() is false when
  // the size is not positive or PDFium cannot allocate it.
  Bitmap(int width, int height, PixelFormat format);
  // Adopts `handle`.
  explicit Bitmap(FPDF_BITMAP handle);

  bool Valid() const { return handle_ != nullptr; }
  int width() const;
  int height() const;
  int stride() const;
  PixelFormat format() const;
  uint8_t* buffer();
  const uint8_t* buffer() const;
  FPDF_BITMAP get() const { return handle_.get(); }

  // Deep copy. Invalid if this bitmap is invalid or allocation fails.
  Bitmap Clone() const;

 private:
  struct Deleter {
    void operator()(FPDF_BITMAP bitmap) const;
  };
  std::unique_ptr<std::remove_pointer<FPDF_BITMAP>::type, Deleter> handle_;
};

struct Rgb {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};
};

// Pixel rectangle; may extend past the image, callers clip.
struct PixelBox {
  int x{0};
  int y{0};
  int width{0};
  int height{0};
};

// Paints `box`, clipped to the image, with an opaque colour. Returns the
// number of pixels painted.
std::size_t FillRect(Bitmap* image, const PixelBox& box, const Rgb& colour);

}  // namespace dlpgate
