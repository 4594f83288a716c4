#ifndef LABEL_GEOMETRY_HPP
#define LABEL_GEOMETRY_HPP

#include <algorithm>
#include <string>
#include <vector>

namespace labelcrop {

/**
 * @brief Width and height of a page or raster, in the unit its rectangles
 * are expressed in (points for pages, pixels for rasters)
 */
struct PageDimensions {
  double width = 0.0;  ///< Page width
  double height = 0.0; ///< Page height
};

/**
 * @brief Axis-aligned rectangle, origin top-left, y increasing downward
 *
 * Coordinates are corner based (x0,y0 top-left, x1,y1 bottom-right) rather
 * than origin + size, matching how text boxes and crop boxes are exchanged
 * with the document layer.
 */
struct Rect {
  double x0 = 0.0; ///< Left edge
  double y0 = 0.0; ///< Top edge
  double x1 = 0.0; ///< Right edge
  double y1 = 0.0; ///< Bottom edge

  Rect() = default;
  Rect(double left, double top, double right, double bottom)
      : x0(left), y0(top), x1(right), y1(bottom) {}

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }
  double centerX() const { return (x0 + x1) / 2.0; }
  double centerY() const { return (y0 + y1) / 2.0; }

  /// True when x0 <= x1 and y0 <= y1
  bool isValid() const { return x0 <= x1 && y0 <= y1; }

  bool contains(double x, double y) const {
    return x >= x0 && x <= x1 && y >= y0 && y <= y1;
  }

  /// Each bound clamped independently into [0,width] x [0,height]
  Rect clampedTo(const PageDimensions &page) const {
    return Rect(std::clamp(x0, 0.0, page.width),
                std::clamp(y0, 0.0, page.height),
                std::clamp(x1, 0.0, page.width),
                std::clamp(y1, 0.0, page.height));
  }

  bool operator==(const Rect &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const Rect &other) const { return !(*this == other); }
};

/**
 * @brief A unit of positioned text on a page (a word or a line of words)
 */
struct TextFragment {
  Rect bbox;        ///< Bounding box in page coordinates
  std::string text; ///< UTF-8 text content
};

/**
 * @brief Candidate bounding box for one label instance before normalization
 */
struct LabelRegion {
  Rect rect;               ///< Detected region in page coordinates
  int sourcePageIndex = 0; ///< 0-indexed page the region was found on
};

/**
 * @brief Canonical output page size shared by every label of a run
 */
struct ReferenceSize {
  double width = 0.0;
  double height = 0.0;

  bool operator==(const ReferenceSize &other) const {
    return width == other.width && height == other.height;
  }
};

/// Canonicalized structured code read from a label
using Identifier = std::string;

} // namespace labelcrop

#endif // LABEL_GEOMETRY_HPP
