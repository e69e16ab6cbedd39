#include <catch2/catch_test_macros.hpp>

#include "redaction/bitmap.h"
#include "redaction/region_redactor.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace dlpgate;

namespace {
// B, G, R of pixel (x, y) in a BGRx bitmap.
std::vector<uint8_t> PixelAt(const Bitmap& image, int x, int y) {
  const uint8_t* p = image.buffer() + y * image.stride() + x * 4;
  return {p[0], p[1], p[2]};
}

const std::vector<uint8_t> kWhite{255, 255, 255};
const std::vector<uint8_t> kBlack{0, 0, 0};

Bitmap WhitePage(int width, int height) {
  Bitmap page(width, height, PixelFormat::kBgrx);
  FillRect(&page, PixelBox{0, 0, width, height}, Rgb{255, 255, 255});
  return page;
}
}  // namespace

TEST_CASE("Bitmap owns a PDFium bitmap", "[bitmap]") {
  Bitmap image(4, 3, PixelFormat::kBgrx);
  REQUIRE(image.Valid());
  REQUIRE(image.width() == 4);
  REQUIRE(image.height() == 3);
  REQUIRE(image.stride() >= 16);
  REQUIRE(image.format() == PixelFormat::kBgrx);

  Bitmap moved = std::move(image);
  REQUIRE(moved.Valid());
  REQUIRE(moved.width() == 4);

  REQUIRE_FALSE(Bitmap().Valid());
  REQUIRE(Bitmap().width() == 0);
  REQUIRE_FALSE(Bitmap(0, 3, PixelFormat::kBgrx).Valid());
  REQUIRE_FALSE(Bitmap(2, 2, PixelFormat::kUnknown).Valid());
}

TEST_CASE("Clone copies pixels into an independent bitmap", "[bitmap]") {
  Bitmap image(2, 2, PixelFormat::kBgrx);
  FillRect(&image, PixelBox{0, 0, 2, 2}, Rgb{10, 20, 30});
  REQUIRE(PixelAt(image, 1, 1) == std::vector<uint8_t>{30, 20, 10});

  Bitmap copy = image.Clone();
  FillRect(&image, PixelBox{0, 0, 2, 2}, Rgb{});
  REQUIRE(PixelAt(copy, 1, 1) == std::vector<uint8_t>{30, 20, 10});
  REQUIRE(PixelAt(image, 1, 1) == kBlack);
  REQUIRE_FALSE(Bitmap().Clone().Valid());
}

TEST_CASE("FillRect clips to the image", "[bitmap]") {
  Bitmap image = WhitePage(4, 3);

  auto painted = FillRect(&image, PixelBox{2, 1, 10, 10}, Rgb{0, 0, 0});
  REQUIRE(painted == 4);  // columns 2-3, rows 1-2
  REQUIRE(PixelAt(image, 2, 1) == kBlack);
  REQUIRE(PixelAt(image, 3, 2) == kBlack);
  REQUIRE(PixelAt(image, 2, 0) == kWhite);
  REQUIRE(PixelAt(image, 1, 1) == kWhite);

  REQUIRE(FillRect(&image, PixelBox{-5, -5, 2, 2}, Rgb{}) == 0);
  REQUIRE(FillRect(&image, PixelBox{0, 0, 0, 3}, Rgb{}) == 0);
  REQUIRE(FillRect(nullptr, PixelBox{0, 0, 1, 1}, Rgb{}) == 0);
}

namespace {
class FixedLocator : public RegionLocator {
 public:
  FixedLocator(std::vector<PixelBox> boxes, bool ok) : boxes_(std::move(boxes)), ok_(ok) {}
  bool Locate(const Bitmap&, std::vector<PixelBox>* boxes, std::string* error) const override {
    if (!ok_) {
      *error = "ocr unavailable";
      return false;
    }
    *boxes = boxes_;
    return true;
  }

 private:
  std::vector<PixelBox> boxes_;
  bool ok_;
};
}  // namespace

TEST_CASE("FillRegionRedactor paints located regions", "[bitmap]") {
  Bitmap page = WhitePage(3, 3);

  FillRegionRedactor redactor(std::make_shared<FixedLocator>(std::vector<PixelBox>{{0, 0, 1, 3}},
                                                             true));
  Bitmap out;
  std::string error;
  REQUIRE(redactor.Redact(page, &out, &error));
  for (int y = 0; y < 3; ++y) {
    REQUIRE(PixelAt(out, 0, y) == kBlack);
    REQUIRE(PixelAt(out, 1, y) == kWhite);
  }
  // Input untouched.
  REQUIRE(PixelAt(page, 0, 0) == kWhite);
}

TEST_CASE("FillRegionRedactor uses the configured fill colour", "[bitmap]") {
  Bitmap page = WhitePage(2, 2);
  FillRegionRedactor redactor(
      std::make_shared<FixedLocator>(std::vector<PixelBox>{{1, 1, 1, 1}}, true),
      Rgb{200, 0, 0});
  Bitmap out;
  std::string error;
  REQUIRE(redactor.Redact(page, &out, &error));
  REQUIRE(PixelAt(out, 1, 1) == std::vector<uint8_t>{0, 0, 200});
}

TEST_CASE("FillRegionRedactor reports failures", "[bitmap]") {
  Bitmap page = WhitePage(2, 2);
  FillRegionRedactor redactor(std::make_shared<FixedLocator>(std::vector<PixelBox>{}, false));
  Bitmap out;
  std::string error;
  REQUIRE_FALSE(redactor.Redact(page, &out, &error));
  REQUIRE(error.find("ocr unavailable") != std::string::npos);

  FillRegionRedactor no_locator(nullptr);
  REQUIRE_FALSE(no_locator.Redact(page, &out, &error));

  FillRegionRedactor ok(std::make_shared<FixedLocator>(std::vector<PixelBox>{}, true));
  REQUIRE_FALSE(ok.Redact(Bitmap(), &out, &error));
}
