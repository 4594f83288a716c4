#include "LabelRenderer.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

#include <cairo.h>

#include <opencv2/imgproc.hpp>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFMatrix.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

namespace labelcrop {

namespace {

struct SurfaceDeleter {
  void operator()(cairo_surface_t *surface) const {
    cairo_surface_destroy(surface);
  }
};

using SurfacePtr = std::unique_ptr<cairo_surface_t, SurfaceDeleter>;

// Copy an 8-bit raster into a Cairo RGB24 surface
SurfacePtr surfaceFromMat(const cv::Mat &image) {
  if (image.empty() || image.depth() != CV_8U) {
    return nullptr;
  }

  cv::Mat bgr;
  if (image.channels() == 1) {
    cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = image;
  }

  SurfacePtr surface(
      cairo_image_surface_create(CAIRO_FORMAT_RGB24, bgr.cols, bgr.rows));
  if (cairo_surface_status(surface.get()) != CAIRO_STATUS_SUCCESS) {
    return nullptr;
  }

  cairo_surface_flush(surface.get());
  unsigned char *data = cairo_image_surface_get_data(surface.get());
  int stride = cairo_image_surface_get_stride(surface.get());

  // RGB24 is stored as BGRX on little-endian
  for (int row = 0; row < bgr.rows; row++) {
    for (int col = 0; col < bgr.cols; col++) {
      cv::Vec3b pixel = bgr.at<cv::Vec3b>(row, col);
      int offset = row * stride + col * 4;
      data[offset + 0] = pixel[0]; // B
      data[offset + 1] = pixel[1]; // G
      data[offset + 2] = pixel[2]; // R
      data[offset + 3] = 255;
    }
  }
  cairo_surface_mark_dirty(surface.get());
  return surface;
}

// Page coordinates are top-left based within the crop box; PDF boxes are
// bottom-left based
QPDFObjectHandle::Rectangle pdfBoxOf(QPDFPageObjectHelper &page,
                                     const Rect &rect) {
  QPDFObjectHandle::Rectangle visible =
      page.getCropBox().getArrayAsRectangle();
  return QPDFObjectHandle::Rectangle(
      visible.llx + rect.x0, visible.ury - rect.y1, visible.llx + rect.x1,
      visible.ury - rect.y0);
}

std::string writeToString(QPDF &pdf) {
  QPDFWriter writer(pdf);
  writer.setStaticID(true);
  writer.setOutputMemory();
  writer.write();

  std::shared_ptr<Buffer> buffer = writer.getBufferSharedPointer();
  return std::string(reinterpret_cast<const char *>(buffer->getBuffer()),
                     buffer->getSize());
}

double elapsedMs(std::chrono::high_resolution_clock::time_point start) {
  auto end = std::chrono::high_resolution_clock::now();
  return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace

Rect fitCentered(const ReferenceSize &content, const ReferenceSize &target) {
  if (!(content.width > 0.0) || !(content.height > 0.0)) {
    return Rect();
  }

  double scale = std::min(target.width / content.width,
                          target.height / content.height);
  double width = content.width * scale;
  double height = content.height * scale;
  double x0 = (target.width - width) / 2.0;
  double y0 = (target.height - height) / 2.0;
  return Rect(x0, y0, x0 + width, y0 + height);
}

bool writePng(const cv::Mat &image, const std::string &path,
              std::string &errorMessage) {
  SurfacePtr surface = surfaceFromMat(image);
  if (!surface) {
    errorMessage = "Failed to create Cairo image surface";
    return false;
  }

  cairo_status_t status =
      cairo_surface_write_to_png(surface.get(), path.c_str());
  if (status != CAIRO_STATUS_SUCCESS) {
    errorMessage = "Failed to write " + path + ": " +
                   cairo_status_to_string(status);
    return false;
  }
  return true;
}

RenderResult PDFLabelRenderer::renderCroppedPages(
    DocumentAccess &doc, const std::vector<int> &pages, const Rect &clip,
    const ReferenceSize &outputSize, int copies) {
  RenderResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  if (pages.empty()) {
    result.errorMessage = "No pages to render";
    return result;
  }
  if (!(outputSize.width > 0.0) || !(outputSize.height > 0.0)) {
    result.errorMessage = "Output size must be positive";
    return result;
  }
  if (!(clip.width() > 0.0) || !(clip.height() > 0.0)) {
    result.errorMessage = "Crop rectangle is empty";
    return result;
  }

  const std::vector<char> &data = doc.rawData();
  if (data.empty()) {
    result.errorMessage = "Document has no PDF data: " + doc.name();
    return result;
  }

  Rect placement =
      fitCentered(ReferenceSize{clip.width(), clip.height()}, outputSize);
  double scale = placement.width() / clip.width();
  // Placement in PDF space, origin bottom-left of the output page
  double placeX = placement.x0;
  double placeY = outputSize.height - placement.y1;

  try {
    QPDF source;
    source.processMemoryFile(doc.name().c_str(), data.data(), data.size());
    source.pushInheritedAttributesToPage();

    QPDF output;
    output.emptyPDF();

    std::vector<QPDFPageObjectHelper> sourcePages =
        QPDFPageDocumentHelper(source).getAllPages();
    QPDFPageDocumentHelper outputPages(output);

    for (int pageIndex : pages) {
      if (pageIndex < 0 ||
          pageIndex >= static_cast<int>(sourcePages.size())) {
        result.errorMessage = "Page " + std::to_string(pageIndex + 1) +
                              " is out of range in " + doc.name();
        result.pageCount = 0;
        result.processingTimeMs = elapsedMs(startTime);
        return result;
      }

      QPDFPageObjectHelper &page = sourcePages[pageIndex];
      QPDFObjectHandle::Rectangle box = pdfBoxOf(page, clip);

      // The whole page as a form XObject; its /BBox clips it to the crop
      QPDFObjectHandle form = page.getFormXObjectForPage(false);
      form.getDict().replaceKey("/BBox",
                                QPDFObjectHandle::newFromRectangle(box));
      QPDFObjectHandle label = output.copyForeignObject(form);

      QPDFMatrix placeLabel(scale, 0.0, 0.0, scale, placeX - scale * box.llx,
                            placeY - scale * box.lly);
      QPDFObjectHandle contents = QPDFObjectHandle::newStream(
          &output, "q\n" + placeLabel.unparse() + " cm\n/Label Do\nQ\n");

      for (int copy = 0; copy < copies; copy++) {
        QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
        xobjects.replaceKey("/Label", label);
        QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
        resources.replaceKey("/XObject", xobjects);

        QPDFObjectHandle newPage = QPDFObjectHandle::newDictionary();
        newPage.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        newPage.replaceKey("/MediaBox",
                           QPDFObjectHandle::newFromRectangle(
                               QPDFObjectHandle::Rectangle(
                                   0.0, 0.0, outputSize.width,
                                   outputSize.height)));
        newPage.replaceKey("/Resources", resources);
        newPage.replaceKey("/Contents", contents);

        outputPages.addPage(
            QPDFPageObjectHelper(output.makeIndirectObject(newPage)), false);
        result.pageCount++;
      }
    }

    result.pdfData = writeToString(output);
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage =
        "Failed to render pages of " + doc.name() + ": " + e.what();
    result.pageCount = 0;
  }

  result.processingTimeMs = elapsedMs(startTime);
  return result;
}

RenderResult PDFLabelRenderer::cropPagesInPlace(DocumentAccess &doc,
                                                const std::vector<int> &pages,
                                                const Rect &cropBox,
                                                int copies) {
  RenderResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  const std::vector<char> &data = doc.rawData();
  if (data.empty()) {
    result.errorMessage = "Document has no PDF data: " + doc.name();
    return result;
  }

  try {
    QPDF source;
    source.processMemoryFile(doc.name().c_str(), data.data(), data.size());
    source.pushInheritedAttributesToPage();

    QPDF output;
    output.emptyPDF();

    std::vector<QPDFPageObjectHelper> sourcePages =
        QPDFPageDocumentHelper(source).getAllPages();
    QPDFPageDocumentHelper outputPages(output);

    for (int pageIndex : pages) {
      if (pageIndex < 0 ||
          pageIndex >= static_cast<int>(sourcePages.size())) {
        result.errorMessage = "Page " + std::to_string(pageIndex + 1) +
                              " is out of range in " + doc.name();
        return result;
      }

      QPDFPageObjectHelper &page = sourcePages[pageIndex];

      QPDFObjectHandle::Rectangle box = pdfBoxOf(page, cropBox);

      for (int copy = 0; copy < copies; copy++) {
        QPDFObjectHandle copied =
            output.copyForeignObject(page.getObjectHandle());
        if (copy > 0) {
          // The foreign copy is cached; repeats need their own page object
          copied = output.makeIndirectObject(copied.shallowCopy());
        }
        copied.replaceKey("/CropBox", QPDFObjectHandle::newFromRectangle(box));
        outputPages.addPage(QPDFPageObjectHelper(copied), false);
        result.pageCount++;
      }
    }

    result.pdfData = writeToString(output);
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage =
        "Failed to crop pages of " + doc.name() + ": " + e.what();
    result.pageCount = 0;
  }

  result.processingTimeMs = elapsedMs(startTime);
  return result;
}

std::string outputFileName(const std::string &prefix, const Identifier &id) {
  std::string safeId = id;
  std::replace(safeId.begin(), safeId.end(), '/', '_');
  std::replace(safeId.begin(), safeId.end(), '\\', '_');
  if (prefix.empty()) {
    return safeId + ".pdf";
  }
  return prefix + " " + safeId + ".pdf";
}

} // namespace labelcrop
