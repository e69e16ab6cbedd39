#include "redaction/region_redactor.h"

#include "server/logging/logger.h"

#include <utility>

namespace dlpgate {

FillRegionRedactor::FillRegionRedactor(std::shared_ptr<const RegionLocator> locator, Rgb fill)
    : locator_(std::move(locator)), fill_(fill) {}

bool FillRegionRedactor::Redact(const Bitmap& page, Bitmap* output, std::string* error) const {
  if (!output) {
    if (error) *error = "output bitmap is null";
    return false;
  }
  if (!locator_) {
    if (error) *error = "no region locator configured";
    return false;
  }
  if (!page.Valid()) {
    if (error) *error = "page bitmap is empty";
    return false;
  }
  std::vector<PixelBox> boxes;
  std::string locate_error;
  if (!locator_->Locate(page, &boxes, &locate_error)) {
    if (error) *error = "region lookup failed: " + locate_error;
    return false;
  }

  *output = page.Clone();
  if (!output->Valid()) {
    if (error) *error = "cannot copy page bitmap";
    return false;
  }
  std::size_t painted = 0;
  for (const auto& box : boxes) {
    painted += FillRect(output, box, fill_);
  }
  log::Debug("redaction", "filled image regions",
             "boxes=" + std::to_string(boxes.size()) + " pixels=" + std::to_string(painted));
  return true;
}

}  // namespace dlpgate
