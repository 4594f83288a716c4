#include "PDFDocumentAccess.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include <tesseract/resultiterator.h>

namespace labelcrop {

PDFDocumentAccess::PDFDocumentAccess(std::vector<char> data, std::string name,
                                     const OcrOptions &ocr)
    : m_data(std::move(data)), m_name(std::move(name)), m_ocr(ocr) {}

PDFDocumentAccess::~PDFDocumentAccess() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

std::unique_ptr<PDFDocumentAccess>
PDFDocumentAccess::open(const std::string &pdfPath, std::string &errorMessage,
                        const OcrOptions &ocr) {
  std::ifstream file(pdfPath, std::ios::binary);
  if (!file) {
    errorMessage = "Failed to open PDF file: " + pdfPath;
    return nullptr;
  }

  std::vector<char> data((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
  if (file.bad()) {
    errorMessage = "Failed to read PDF file: " + pdfPath;
    return nullptr;
  }

  return openFromData(std::move(data), pdfPath, errorMessage, ocr);
}

std::unique_ptr<PDFDocumentAccess>
PDFDocumentAccess::openFromData(std::vector<char> data,
                                const std::string &name,
                                std::string &errorMessage,
                                const OcrOptions &ocr) {
  if (data.empty()) {
    errorMessage = "PDF data is empty: " + name;
    return nullptr;
  }

  std::unique_ptr<PDFDocumentAccess> access(
      new PDFDocumentAccess(std::move(data), name, ocr));

  // Poppler keeps pointing into m_data, which lives as long as the document
  access->m_document.reset(poppler::document::load_from_raw_data(
      access->m_data.data(), static_cast<int>(access->m_data.size())));

  if (!access->m_document) {
    errorMessage = "Failed to load PDF file: " + name;
    return nullptr;
  }

  if (access->m_document->is_locked()) {
    errorMessage = "PDF file is password protected: " + name;
    return nullptr;
  }

  return access;
}

DocumentOpener PDFDocumentAccess::opener(const OcrOptions &ocr) {
  return [ocr](const std::string &source,
               std::string &errorMessage) -> std::unique_ptr<DocumentAccess> {
    return open(source, errorMessage, ocr);
  };
}

int PDFDocumentAccess::pageCount() const { return m_document->pages(); }

PageDimensions PDFDocumentAccess::getPageDimensions(int pageIndex) {
  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    return PageDimensions();
  }
  poppler::rectf pageRect = page->page_rect();
  return PageDimensions{pageRect.width(), pageRect.height()};
}

std::vector<TextFragment> PDFDocumentAccess::pageWords(int pageIndex) {
  auto cached = m_wordCache.find(pageIndex);
  if (cached != m_wordCache.end()) {
    return cached->second;
  }

  std::vector<TextFragment> words = extractTextLayer(pageIndex);
  bool ocred = false;
  if (words.empty() && m_ocr.enabled) {
    words = recognizeWords(pageIndex);
    ocred = !words.empty();
  }

  m_ocredPages[pageIndex] = ocred;
  m_wordCache[pageIndex] = words;
  return words;
}

bool PDFDocumentAccess::pageWasOcred(int pageIndex) const {
  auto it = m_ocredPages.find(pageIndex);
  return it != m_ocredPages.end() && it->second;
}

std::vector<TextFragment> PDFDocumentAccess::extractTextLayer(int pageIndex) {
  std::vector<TextFragment> words;

  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    std::cerr << "Failed to create page " << (pageIndex + 1) << " of "
              << m_name << std::endl;
    return words;
  }

  // Boxes are already in top-left page coordinates
  std::vector<poppler::text_box> textBoxes = page->text_list();
  words.reserve(textBoxes.size());

  for (auto &textBox : textBoxes) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string text(textBytes.begin(), textBytes.end());
    if (text.empty()) {
      continue;
    }

    poppler::rectf bbox = textBox.bbox();
    TextFragment word;
    word.text = text;
    word.bbox = Rect(bbox.left(), bbox.top(), bbox.right(), bbox.bottom());
    words.push_back(std::move(word));
  }

  return words;
}

cv::Mat PDFDocumentAccess::getRaster(int pageIndex, double zoom) {
  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    return cv::Mat();
  }

  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  double dpi = 72.0 * zoom;
  poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
  if (!popplerImage.is_valid()) {
    std::cerr << "Failed to render page " << (pageIndex + 1) << " of "
              << m_name << std::endl;
    return cv::Mat();
  }

  int width = popplerImage.width();
  int height = popplerImage.height();

  // ARGB32 is stored as BGRA bytes on little-endian machines
  cv::Mat bgra(height, width, CV_8UC4,
               const_cast<char *>(popplerImage.const_data()),
               popplerImage.bytes_per_row());
  cv::Mat bgr;
  cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
  return bgr;
}

bool PDFDocumentAccess::initializeOcr() {
  if (m_tesseract) {
    return true;
  }
  if (m_ocrFailed) {
    return false;
  }

  const char *tessDataPath = nullptr;

  // Priority 1: configured path, priority 2: TESSDATA_PREFIX,
  // otherwise Tesseract's compiled-in default
  if (!m_ocr.tessDataPath.empty()) {
    tessDataPath = m_ocr.tessDataPath.c_str();
  } else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
  }

  auto api = std::make_unique<tesseract::TessBaseAPI>();
  if (api->Init(tessDataPath, m_ocr.language.c_str()) != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_ocr.language << ", OCR fallback disabled" << std::endl;
    m_ocrFailed = true;
    return false;
  }

  api->SetPageSegMode(tesseract::PSM_AUTO);
  m_tesseract = std::move(api);
  return true;
}

std::vector<TextFragment> PDFDocumentAccess::recognizeWords(int pageIndex) {
  std::vector<TextFragment> words;
  if (!initializeOcr()) {
    return words;
  }

  cv::Mat raster = getRaster(pageIndex, m_ocr.dpi / 72.0);
  if (raster.empty()) {
    return words;
  }

  PageDimensions page = getPageDimensions(pageIndex);
  double scaleX = page.width / raster.cols;
  double scaleY = page.height / raster.rows;

  cv::Mat rgbImage;
  cv::cvtColor(raster, rgbImage, cv::COLOR_BGR2RGB);
  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));

  // Must call Recognize before GetIterator
  if (m_tesseract->Recognize(nullptr) != 0) {
    std::cerr << "OCR failed on page " << (pageIndex + 1) << " of " << m_name
              << std::endl;
    return words;
  }

  std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
  tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

  if (ri != nullptr) {
    do {
      std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
      if (!word || *word.get() == '\0') {
        continue;
      }

      int x1, y1, x2, y2;
      ri->BoundingBox(level, &x1, &y1, &x2, &y2);

      TextFragment fragment;
      fragment.text = word.get();
      fragment.bbox = Rect(x1 * scaleX, y1 * scaleY, x2 * scaleX, y2 * scaleY);
      words.push_back(std::move(fragment));
    } while (ri->Next(level));
  }

  std::cerr << "OCR recognized " << words.size() << " words on page "
            << (pageIndex + 1) << " of " << m_name << std::endl;
  return words;
}

} // namespace labelcrop
