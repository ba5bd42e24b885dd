#pragma once
#include "geometry.hpp"

enum class Placement { Above, Below };

struct OverlayPlacement {
  Placement placement = Placement::Below;
  Rect rect;
};

// Below if it fits, else above if it fits, else the roomier side (below on a tie).
// anchor and result are in the coordinates of `bounds` (origin 0,0)
OverlayPlacement place_overlay(const Rect& anchor, const Size& natural, const Size& bounds);
