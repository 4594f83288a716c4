#ifndef DOCUMENT_ACCESS_HPP
#define DOCUMENT_ACCESS_HPP

#include "LabelGeometry.hpp"

#include <opencv2/opencv.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace labelcrop {

/**
 * @brief Read access to one opened document
 *
 * All coordinates are page coordinates with the origin at the top-left of
 * the page's visible area. Implementations are not required to be thread
 * safe; concurrent work opens one instance per thread.
 */
class DocumentAccess {
public:
  virtual ~DocumentAccess() = default;

  /// Display name used in messages and results
  virtual std::string name() const = 0;

  virtual int pageCount() const = 0;

  virtual PageDimensions getPageDimensions(int pageIndex) = 0;

  /// Every word of the page with its bounding box
  virtual std::vector<TextFragment> pageWords(int pageIndex) = 0;

  /**
   * @brief Render a page to a BGR raster
   * @param pageIndex 0-indexed page
   * @param zoom Scale relative to 72 DPI (2.0 = 144 DPI)
   * @return Raster, empty on failure
   */
  virtual cv::Mat getRaster(int pageIndex, double zoom) = 0;

  /// Original document bytes (empty when the source has none)
  virtual const std::vector<char> &rawData() const = 0;

  /**
   * @brief Positioned text fragments used for column clustering
   *
   * The default merges the page's words into line fragments.
   */
  virtual std::vector<TextFragment> getTextFragments(int pageIndex);

  /// Grayscale (CV_8UC1) raster of a page, empty on failure
  virtual cv::Mat getRasterGray(int pageIndex, double zoom);

  /// Words whose center lies inside clip
  std::vector<TextFragment> getWords(int pageIndex, const Rect &clip);

  /// Text inside clip in reading order
  std::string getText(int pageIndex, const Rect &clip);

  /// Text of the whole page in reading order
  std::string getText(int pageIndex);
};

/**
 * @brief Opens a document from a source (a file path)
 *
 * Returns nullptr and fills errorMessage when the source cannot be opened.
 */
using DocumentOpener = std::function<std::unique_ptr<DocumentAccess>(
    const std::string &source, std::string &errorMessage)>;

} // namespace labelcrop

#endif // DOCUMENT_ACCESS_HPP
