#ifndef PDF_DOCUMENT_ACCESS_HPP
#define PDF_DOCUMENT_ACCESS_HPP

#include "DocumentAccess.hpp"

#include <tesseract/baseapi.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
}

namespace labelcrop {

/**
 * @brief Options for reading pages that carry no text layer
 */
struct OcrOptions {
  bool enabled = false;     ///< Run OCR when a page has no words
  std::string tessDataPath; ///< Empty = TESSDATA_PREFIX or Tesseract default
  std::string language = "eng";
  double dpi = 300.0;       ///< Raster resolution fed to Tesseract
};

/**
 * @brief DocumentAccess over a PDF loaded with Poppler
 *
 * The file is read into memory once; Poppler parses from that buffer and
 * the same bytes are available to writers that copy pages out of the
 * document. Word lists are cached per page.
 *
 * Example usage:
 * @code
 * std::string error;
 * auto doc = labelcrop::PDFDocumentAccess::open("labels.pdf", error);
 * if (doc) {
 *     auto words = doc->pageWords(0);
 * }
 * @endcode
 */
class PDFDocumentAccess : public DocumentAccess {
public:
  ~PDFDocumentAccess() override;

  PDFDocumentAccess(const PDFDocumentAccess &) = delete;
  PDFDocumentAccess &operator=(const PDFDocumentAccess &) = delete;

  /**
   * @brief Open a PDF file
   * @param pdfPath Path to the PDF file
   * @param errorMessage Set when nullptr is returned
   * @param ocr OCR fallback options
   * @return Opened document, or nullptr
   */
  static std::unique_ptr<PDFDocumentAccess>
  open(const std::string &pdfPath, std::string &errorMessage,
       const OcrOptions &ocr = OcrOptions());

  /**
   * @brief Open a PDF held in memory
   * @param data PDF bytes, owned by the returned document
   * @param name Display name
   */
  static std::unique_ptr<PDFDocumentAccess>
  openFromData(std::vector<char> data, const std::string &name,
               std::string &errorMessage,
               const OcrOptions &ocr = OcrOptions());

  /// Opener suitable for LabelBatchProcessor
  static DocumentOpener opener(const OcrOptions &ocr = OcrOptions());

  std::string name() const override { return m_name; }
  int pageCount() const override;
  PageDimensions getPageDimensions(int pageIndex) override;
  std::vector<TextFragment> pageWords(int pageIndex) override;
  cv::Mat getRaster(int pageIndex, double zoom) override;
  const std::vector<char> &rawData() const override { return m_data; }

  /// Whether words of a page came from OCR
  bool pageWasOcred(int pageIndex) const;

private:
  PDFDocumentAccess(std::vector<char> data, std::string name,
                    const OcrOptions &ocr);

  std::vector<TextFragment> extractTextLayer(int pageIndex);
  std::vector<TextFragment> recognizeWords(int pageIndex);
  bool initializeOcr();

  std::vector<char> m_data;                     ///< Backing bytes for Poppler
  std::unique_ptr<poppler::document> m_document; ///< Parsed document
  std::string m_name;
  OcrOptions m_ocr;
  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract; ///< Created on demand
  bool m_ocrFailed = false;
  std::map<int, std::vector<TextFragment>> m_wordCache;
  std::map<int, bool> m_ocredPages;
};

} // namespace labelcrop

#endif // PDF_DOCUMENT_ACCESS_HPP
