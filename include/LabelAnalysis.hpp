#ifndef LABEL_ANALYSIS_HPP
#define LABEL_ANALYSIS_HPP

#include "LabelCropConfig.hpp"
#include "LabelGeometry.hpp"
#include "ReferenceSizeCell.hpp"

#include <opencv2/opencv.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace labelcrop {

/**
 * @brief Result of 1-D k-means clustering over x-centers
 */
struct ClusterAssignment {
  std::vector<int> columnOf;   ///< Column index for each input point
  std::vector<double> centers; ///< Final center of each column
};

/**
 * @brief Locates the leftmost of k repeated label columns on a page
 *
 * Text fragment x-centers are clustered with 1-D k-means. Centers start
 * evenly spaced across the observed x range and are refined for exactly
 * kIterations rounds; there is no convergence check, so results match the
 * established behavior even on inputs where early exit would differ.
 *
 * Example usage:
 * @code
 * labelcrop::ColumnClusterer clusterer(3, 5, 8);
 * labelcrop::Rect label = clusterer.leftmostColumnRect(fragments, page);
 * @endcode
 */
class ColumnClusterer {
public:
  static constexpr int kIterations = 10;

  /**
   * @param columns Number of labels across the page (k >= 1)
   * @param paddingX Padding added left and right of the column bound
   * @param paddingY Padding added above and below the column bound
   */
  ColumnClusterer(int columns, double paddingX, double paddingY);

  /**
   * @brief Cluster points into k columns
   *
   * For k == 1 or zero variance a single center at the midpoint of the
   * range is returned and every point is assigned to it. Distance ties go
   * to the lowest column index; an empty column keeps its center.
   *
   * @param xs Points to cluster (may be empty)
   * @param k Requested number of columns
   * @return Assignment of each point and the final centers
   */
  static ClusterAssignment cluster(const std::vector<double> &xs, int k);

  /**
   * @brief Bounding rectangle of the leftmost column's fragments
   *
   * Falls back to the equal-width column (0, 0, width/k, height) when the
   * page has no text or the leftmost column ends up empty.
   *
   * @param fragments Text fragments of the page (blank ones are ignored)
   * @param page Page dimensions used for the fallback and for clamping
   * @return Padded tight bound, clamped to the page
   */
  Rect leftmostColumnRect(const std::vector<TextFragment> &fragments,
                          const PageDimensions &page) const;

  /// Equal-width first column used when clustering cannot decide
  Rect fallbackRect(const PageDimensions &page) const;

  int columns() const { return m_columns; }

private:
  int m_columns;
  double m_paddingX;
  double m_paddingY;
};

/**
 * @brief Reads a structured identifier out of free label text
 *
 * One extractor is bound to one grammar; callers downstream only see the
 * canonical identifier.
 */
class IdentifierExtractor {
public:
  explicit IdentifierExtractor(IdentifierGrammar grammar);

  /**
   * @brief Find the identifier in the text
   * @param text Raw text, any whitespace layout
   * @return Canonical identifier, or std::nullopt when the grammar does not
   * match (expected for pages without a label)
   */
  std::optional<Identifier> tryExtract(const std::string &text) const;

  IdentifierGrammar grammar() const { return m_grammar; }

  /// Collapse whitespace runs to a single space and trim both ends
  static std::string normalizeWhitespace(const std::string &text);

private:
  IdentifierGrammar m_grammar;
  std::regex m_pattern;
};

/**
 * @brief Word most likely to be the human-readable barcode digits
 */
struct BarcodeAnchor {
  Rect bbox;          ///< Bounding box of the winning word
  double centerX = 0; ///< Horizontal center of bbox
  std::string digits; ///< Digits of the word, other characters removed
};

/**
 * @brief Finds the barcode digit line inside a label region
 */
class BarcodeAnchorLocator {
public:
  explicit BarcodeAnchorLocator(int minDigits = 8);

  /**
   * @brief Pick the word with the most digits
   *
   * Ties keep the first word encountered. Fewer than minDigits digits is
   * not a barcode (prices, quantities) and yields std::nullopt.
   */
  std::optional<BarcodeAnchor>
  locate(const std::vector<TextFragment> &words) const;

  static std::string digitsOf(const std::string &text);

private:
  int m_minDigits;
};

/**
 * @brief Turns a detected label region into the final crop rectangle
 */
class CropGeometryNormalizer {
public:
  CropGeometryNormalizer(SizePolicy policy, ReferenceSize fixedReference);

  /**
   * @brief Final crop rectangle for one label
   *
   * FixedReference centers a reference-size window on the barcode anchor
   * with its top at the region top. Without an anchor, and for the other
   * policies, the region is returned unchanged.
   */
  Rect normalize(const Rect &labelRegion,
                 const std::optional<BarcodeAnchor> &anchor,
                 const PageDimensions &page) const;

  /**
   * @brief Window of width x height centered on centerX, top at top
   *
   * A window crossing a page edge is shifted rigidly back inside, keeping
   * its size. Only a window larger than the page on an axis is reduced to
   * the full page extent on that axis.
   */
  static Rect barcodeCenteredWindow(double centerX, double top, double width,
                                    double height, const PageDimensions &page);

  /**
   * @brief Output page size handed to the compositor for a crop
   * @return std::nullopt under FirstSeen while the cell is still unset
   */
  std::optional<ReferenceSize> outputSize(const Rect &crop,
                                          const ReferenceSizeCell &cell) const;

  /// Whether normalize() makes use of a barcode anchor
  bool usesAnchor() const { return m_policy == SizePolicy::FixedReference; }

  SizePolicy policy() const { return m_policy; }

private:
  SizePolicy m_policy;
  ReferenceSize m_fixedReference;
};

/**
 * @brief Crop detected from the dark pixels of a raster
 */
struct ContentCrop {
  Rect pixelBox;             ///< Aspect-corrected box in raster pixels
  Rect pageRect;             ///< Same box in page coordinates
  bool foundContent = false; ///< False when the full-raster fallback was used
};

/**
 * @brief Bounds printed content by thresholding a grayscale raster
 */
class ContentMaskCropDetector {
public:
  ContentMaskCropDetector(int intensityThreshold, double targetAspectRatio);

  /**
   * @brief Bounding box of every pixel darker than the threshold
   *
   * Right and bottom bounds are the indices of the last content pixel.
   *
   * @param raster Grayscale (CV_8UC1) raster; color rasters are converted
   * @return Pixel box, or std::nullopt if no pixel qualifies
   */
  std::optional<Rect> contentBounds(const cv::Mat &raster) const;

  /**
   * @brief Grow the narrower dimension until width/height == ratio
   *
   * The box is never shrunk and stays centered on its original center.
   */
  static Rect expandToAspect(const Rect &box, double ratio);

  /**
   * @brief Detect, aspect-correct, clamp, and convert to page space
   * @param raster Grayscale raster of the page
   * @param page Page dimensions the raster was rendered from
   */
  ContentCrop detect(const cv::Mat &raster, const PageDimensions &page) const;

  /**
   * @brief Preview of the crop resized to a fixed pixel size
   * @return Resized crop, empty if the box does not intersect the raster
   */
  static cv::Mat renderPreview(const cv::Mat &raster, const Rect &pixelBox,
                               int width, int height);

private:
  int m_threshold;
  double m_targetRatio;
};

} // namespace labelcrop

#endif // LABEL_ANALYSIS_HPP
