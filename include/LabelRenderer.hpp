#ifndef LABEL_RENDERER_HPP
#define LABEL_RENDERER_HPP

#include "DocumentAccess.hpp"
#include "LabelGeometry.hpp"

#include <string>
#include <vector>

namespace labelcrop {

/**
 * @brief Result of producing one output document
 */
struct RenderResult {
  bool success = false;        ///< Whether rendering succeeded
  std::string errorMessage;    ///< Error message if failed
  std::string pdfData;         ///< Output PDF bytes
  int pageCount = 0;           ///< Pages in the output document
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Produces output PDFs from crop rectangles of source pages
 */
class LabelCompositor {
public:
  virtual ~LabelCompositor() = default;

  /**
   * @brief Render clip of each page scaled onto an output page
   * @param doc Source document
   * @param pages 0-indexed source pages, one output page per entry and copy
   * @param clip Region of the source pages, page coordinates
   * @param outputSize Output page size in points
   * @param copies Times each source page is repeated
   */
  virtual RenderResult renderCroppedPages(DocumentAccess &doc,
                                          const std::vector<int> &pages,
                                          const Rect &clip,
                                          const ReferenceSize &outputSize,
                                          int copies) = 0;

  /**
   * @brief Copy pages into a new document and set their crop box
   *
   * Page content is kept as is; only the visible area changes.
   */
  virtual RenderResult cropPagesInPlace(DocumentAccess &doc,
                                        const std::vector<int> &pages,
                                        const Rect &cropBox, int copies) = 0;

  /// Single-page convenience form of renderCroppedPages()
  RenderResult renderCroppedPage(DocumentAccess &doc, int pageIndex,
                                 const Rect &clip,
                                 const ReferenceSize &outputSize) {
    return renderCroppedPages(doc, {pageIndex}, clip, outputSize, 1);
  }
};

/**
 * @brief Compositor writing PDFs with qpdf
 *
 * Both operations keep the source pages as vector content.
 * renderCroppedPages() wraps each source page in a form XObject clipped to
 * the crop and places it, scaled uniformly and centered, on a new page of
 * outputSize points. cropPagesInPlace() copies page objects and rewrites
 * /CropBox.
 */
class PDFLabelRenderer : public LabelCompositor {
public:
  RenderResult renderCroppedPages(DocumentAccess &doc,
                                  const std::vector<int> &pages,
                                  const Rect &clip,
                                  const ReferenceSize &outputSize,
                                  int copies) override;

  RenderResult cropPagesInPlace(DocumentAccess &doc,
                                const std::vector<int> &pages,
                                const Rect &cropBox, int copies) override;
};

/**
 * @brief Largest rectangle of content's aspect ratio inside target
 *
 * One scale factor for both axes, centered on the free axis. Coordinates
 * are relative to the top-left of target. Returns an empty Rect when
 * content has no area.
 */
Rect fitCentered(const ReferenceSize &content, const ReferenceSize &target);

/**
 * @brief Write an 8-bit gray, BGR or BGRA image as PNG with Cairo
 * @return false with errorMessage filled on failure
 */
bool writePng(const cv::Mat &image, const std::string &path,
              std::string &errorMessage);

/**
 * @brief Output file name of a label: "<prefix> <identifier>.pdf"
 *
 * Path separators in the identifier are replaced with '_'.
 */
std::string outputFileName(const std::string &prefix, const Identifier &id);

} // namespace labelcrop

#endif // LABEL_RENDERER_HPP
