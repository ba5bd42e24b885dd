#include "overlay.hpp"
#include <algorithm>

OverlayPlacement place_overlay(const Rect& anchor, const Size& natural, const Size& bounds) {
  bool fits_below = anchor.max_y() + natural.height() < bounds.height();
  bool fits_above = natural.height() <= anchor.min_y();

  OverlayPlacement out;
  int height = natural.height();
  if (!fits_below && !fits_above) {
    int space_below = bounds.height() - anchor.max_y() + 1;
    int space_above = anchor.min_y() + 1;
    if (space_above > space_below) {
      out.placement = Placement::Above;
      height = space_above;
    } else {
      out.placement = Placement::Below;
      height = space_below;
    }
  } else if (fits_below) {
    out.placement = Placement::Below;
  } else {
    out.placement = Placement::Above;
  }

  int width = anchor.size().width();
  int x = std::max({0, anchor.max_x() - width, anchor.min_x()});
  int y = out.placement == Placement::Below ? anchor.max_y() : anchor.min_y() - height;
  out.rect = Rect(x, y, width, height);
  return out;
}
