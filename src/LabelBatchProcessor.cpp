#include "LabelBatchProcessor.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <omp.h>

namespace labelcrop {

namespace {

void logLine(const std::string &message) {
#pragma omp critical(labelcrop_log)
  std::cerr << message << std::endl;
}

std::string describe(const Rect &rect) {
  std::ostringstream out;
  out << "(" << rect.x0 << ", " << rect.y0 << ", " << rect.x1 << ", "
      << rect.y1 << ")";
  return out.str();
}

bool writeFile(const std::filesystem::path &path, const std::string &data,
               std::string &errorMessage) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    errorMessage = "Failed to create output file: " + path.string();
    return false;
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!file) {
    errorMessage = "Failed to write output file: " + path.string();
    return false;
  }
  return true;
}

} // namespace

LabelBatchProcessor::LabelBatchProcessor(
    const LabelCropConfig &config, DocumentOpener opener,
    std::shared_ptr<LabelCompositor> compositor)
    : m_config(config), m_opener(std::move(opener)),
      m_compositor(std::move(compositor)),
      m_clusterer(config.columns, config.paddingX, config.paddingY),
      m_extractor(config.grammar), m_locator(config.minBarcodeDigits),
      m_normalizer(config.sizePolicy,
                   ReferenceSize{config.referenceWidth,
                                 config.referenceHeight}),
      m_detector(config.intensityThreshold, config.targetAspectRatio) {}

void LabelBatchProcessor::debug(const std::string &message) const {
  if (m_config.verbose) {
    logLine("DEBUG: " + message);
  }
}

BatchResult LabelBatchProcessor::analyze(const std::vector<std::string> &sources,
                                         const std::atomic<bool> *cancel) const {
  BatchResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  ReferenceSizeCell referenceSize;
  analyzePass(sources, referenceSize, result, cancel);
  result.referenceSize = referenceSize.get();
  result.success = !result.labels.empty() || result.failures.empty();

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return result;
}

BatchResult LabelBatchProcessor::process(const std::vector<std::string> &sources,
                                         const std::atomic<bool> *cancel) const {
  BatchResult result;
  auto startTime = std::chrono::high_resolution_clock::now();

  // The reference size lives for exactly one run and is written only by the
  // sequential analysis pass; the render pass reads it.
  ReferenceSizeCell referenceSize;
  analyzePass(sources, referenceSize, result, cancel);
  result.referenceSize = referenceSize.get();

  if (!result.cancelled && !result.labels.empty()) {
    renderPass(sources, referenceSize, result, cancel);
  }

  bool anyOutput = false;
  for (const auto &output : result.outputs) {
    anyOutput = anyOutput || output.success;
  }
  result.success = anyOutput || (result.labels.empty() &&
                                 result.failures.empty());

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();
  return result;
}

void LabelBatchProcessor::analyzePass(const std::vector<std::string> &sources,
                                      ReferenceSizeCell &referenceSize,
                                      BatchResult &result,
                                      const std::atomic<bool> *cancel) const {
  PageGroupAggregator aggregator;
  std::vector<LabelPlan> plans;

  for (size_t i = 0; i < sources.size(); i++) {
    if (isCancelled(cancel)) {
      result.cancelled = true;
      break;
    }

    const std::string &source = sources[i];
    logLine("Processing: " + source);

    std::string errorMessage;
    std::unique_ptr<DocumentAccess> doc;
    try {
      doc = m_opener(source, errorMessage);
    } catch (const std::exception &e) {
      errorMessage = std::string("Error opening document: ") + e.what();
    }

    if (!doc) {
      if (errorMessage.empty()) {
        errorMessage = "Failed to open document: " + source;
      }
      logLine("Error opening " + source + ": " + errorMessage);
      result.failures.push_back({source, errorMessage});
      continue;
    }

    if (doc->pageCount() == 0) {
      logLine(source + ": no pages.");
      result.failures.push_back({source, "Document has no pages"});
      continue;
    }

    result.documentCount++;
    debug(source + " has " + std::to_string(doc->pageCount()) + " pages");

    try {
      if (m_config.detection == DetectionStrategy::ContentMask) {
        analyzeByMask(static_cast<int>(i), source, *doc, aggregator,
                      referenceSize, plans, result, cancel);
      } else {
        analyzeByColumns(static_cast<int>(i), source, *doc, aggregator,
                         referenceSize, plans, result, cancel);
      }
    } catch (const std::exception &e) {
      // Groups already opened for this document stay in the run
      logLine("Error processing " + source + ": " + e.what());
      result.failures.push_back(
          {source, std::string("Processing failed: ") + e.what()});
    }
  }

  // Every new group appended exactly one plan, in the same order
  const std::vector<Group> &groups = aggregator.groups();
  for (size_t i = 0; i < groups.size() && i < plans.size(); i++) {
    plans[i].group = groups[i];
  }
  result.labels = std::move(plans);
  result.duplicatePages = aggregator.duplicateCount();
}

void LabelBatchProcessor::analyzeByColumns(
    int documentIndex, const std::string &source, DocumentAccess &doc,
    PageGroupAggregator &aggregator, ReferenceSizeCell &referenceSize,
    std::vector<LabelPlan> &plans, BatchResult &result,
    const std::atomic<bool> *cancel) const {
  for (int pageIndex = 0; pageIndex < doc.pageCount(); pageIndex++) {
    if (isCancelled(cancel)) {
      result.cancelled = true;
      return;
    }
    result.pagesScanned++;

    PageDimensions page = doc.getPageDimensions(pageIndex);

    // 1) Rough label area from the leftmost text column
    Rect region =
        m_clusterer.leftmostColumnRect(doc.getTextFragments(pageIndex), page);

    // 2) Identifier from the text inside that area
    std::optional<Identifier> identifier =
        m_extractor.tryExtract(doc.getText(pageIndex, region));
    if (!identifier) {
      result.pagesWithoutIdentifier++;
      debug("No identifier on page " + std::to_string(pageIndex + 1) +
            " of " + source);
      continue;
    }

    // 3) Crop rectangle, computed for the first page of an identifier only
    auto outcome = aggregator.offer(
        documentIndex, pageIndex, identifier,
        [&, pageIndex, page, region]() {
          LabelPlan plan;
          plan.source = source;
          plan.pageSize = page;
          plan.detectedRegion = region;

          std::optional<BarcodeAnchor> anchor;
          if (m_normalizer.usesAnchor()) {
            anchor = m_locator.locate(doc.getWords(pageIndex, region));
          }
          plan.anchored = anchor.has_value();

          if (m_config.sizePolicy == SizePolicy::FirstSeen &&
              referenceSize.trySet({region.width(), region.height()})) {
            std::ostringstream out;
            out << "Reference size set to " << region.width() << " x "
                << region.height() << " by " << *identifier;
            logLine(out.str());
          }

          Rect crop = m_normalizer.normalize(region, anchor, page);
          debug("Label " + *identifier + " on page " +
                std::to_string(pageIndex + 1) + ": region " +
                describe(region) + ", crop " + describe(crop) +
                (plan.anchored ? " (barcode " + anchor->digits + ")"
                               : " (no barcode anchor)"));
          plans.push_back(std::move(plan));
          return crop;
        });

    if (outcome == PageGroupAggregator::Outcome::Duplicate) {
      debug("Skipping duplicate identifier " + *identifier + " on page " +
            std::to_string(pageIndex + 1) + " of " + source);
    }
  }
}

void LabelBatchProcessor::analyzeByMask(
    int documentIndex, const std::string &source, DocumentAccess &doc,
    PageGroupAggregator &aggregator, ReferenceSizeCell &referenceSize,
    std::vector<LabelPlan> &plans, BatchResult &result,
    const std::atomic<bool> *cancel) const {
  // One crop rectangle per document, detected on its first page
  PageDimensions firstPage = doc.getPageDimensions(0);
  cv::Mat raster = doc.getRasterGray(0, m_config.rasterZoom);
  if (raster.empty()) {
    logLine("Failed to rasterize first page of " + source);
    result.failures.push_back({source, "Failed to rasterize first page"});
    return;
  }

  ContentCrop crop = m_detector.detect(raster, firstPage);
  if (!crop.foundContent) {
    logLine(source + ": no content detected, using the whole page");
  }

  Rect region = crop.pageRect;
  std::optional<BarcodeAnchor> anchor;
  if (m_normalizer.usesAnchor()) {
    anchor = m_locator.locate(doc.getWords(0, region));
  }
  Rect documentRect = m_normalizer.normalize(region, anchor, firstPage);
  debug("Crop of " + source + ": pixels " + describe(crop.pixelBox) +
        ", page " + describe(region) + ", final " + describe(documentRect));

  if (!m_config.previewPath.empty() && result.previewPath.empty()) {
    cv::Mat color = doc.getRaster(0, m_config.rasterZoom);
    cv::Mat preview = ContentMaskCropDetector::renderPreview(
        color, crop.pixelBox, m_config.previewWidth, m_config.previewHeight);
    std::string previewError;
    if (writePng(preview, m_config.previewPath, previewError)) {
      result.previewPath = m_config.previewPath;
      logLine("Preview written: " + m_config.previewPath);
    } else {
      logLine("Failed to write preview " + m_config.previewPath + ": " +
              previewError);
    }
  }

  for (int pageIndex = 0; pageIndex < doc.pageCount(); pageIndex++) {
    if (isCancelled(cancel)) {
      result.cancelled = true;
      return;
    }
    result.pagesScanned++;

    std::optional<Identifier> identifier =
        m_extractor.tryExtract(doc.getText(pageIndex));
    if (!identifier) {
      result.pagesWithoutIdentifier++;
      debug("No identifier on page " + std::to_string(pageIndex + 1) +
            " of " + source);
      continue;
    }

    aggregator.offer(documentIndex, pageIndex, identifier, [&]() {
      LabelPlan plan;
      plan.source = source;
      plan.pageSize = firstPage;
      plan.detectedRegion = region;
      plan.anchored = anchor.has_value();

      if (m_config.sizePolicy == SizePolicy::FirstSeen &&
          referenceSize.trySet({region.width(), region.height()})) {
        std::ostringstream out;
        out << "Reference size set to " << region.width() << " x "
            << region.height() << " by " << *identifier;
        logLine(out.str());
      }

      plans.push_back(std::move(plan));
      return documentRect;
    });
  }
}

void LabelBatchProcessor::renderPass(const std::vector<std::string> &sources,
                                     const ReferenceSizeCell &referenceSize,
                                     BatchResult &result,
                                     const std::atomic<bool> *cancel) const {
  result.outputs.assign(result.labels.size(), LabelOutput());
  for (size_t i = 0; i < result.labels.size(); i++) {
    result.outputs[i].key = result.labels[i].group.key;
    result.outputs[i].fileName =
        outputFileName(m_config.outputPrefix, result.labels[i].group.key);
  }

  if (!m_config.outputDir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(m_config.outputDir, ec);
    if (ec) {
      std::string message = "Failed to create output directory " +
                            m_config.outputDir + ": " + ec.message();
      logLine(message);
      for (auto &output : result.outputs) {
        output.errorMessage = message;
      }
      return;
    }
  }

  // Labels grouped per document; each task opens its own document handle
  std::vector<int> documents;
  std::vector<std::vector<size_t>> labelsOf(sources.size());
  for (size_t i = 0; i < result.labels.size(); i++) {
    int documentIndex = result.labels[i].group.documentIndex;
    if (labelsOf[documentIndex].empty()) {
      documents.push_back(documentIndex);
    }
    labelsOf[documentIndex].push_back(i);
  }

  int threadCount =
      m_config.threads > 0 ? m_config.threads : omp_get_max_threads();
  int taskCount = static_cast<int>(documents.size());

#pragma omp parallel for schedule(dynamic) num_threads(threadCount)
  for (int task = 0; task < taskCount; task++) {
    int documentIndex = documents[task];
    const std::string &source = sources[documentIndex];

    std::string errorMessage;
    std::unique_ptr<DocumentAccess> doc;
    try {
      doc = m_opener(source, errorMessage);
    } catch (const std::exception &e) {
      errorMessage = std::string("Error opening document: ") + e.what();
    }
    if (!doc) {
      if (errorMessage.empty()) {
        errorMessage = "Failed to reopen document: " + source;
      }
      logLine("Error opening " + source + ": " + errorMessage);
#pragma omp critical(labelcrop_failures)
      result.failures.push_back({source, errorMessage});
    }

    for (size_t labelIndex : labelsOf[documentIndex]) {
      LabelOutput &output = result.outputs[labelIndex];

      if (!doc) {
        output.errorMessage = errorMessage;
        continue;
      }
      if (isCancelled(cancel)) {
        output.errorMessage = "Cancelled";
        continue;
      }

      LabelOutput rendered;
      try {
        rendered = renderLabel(*doc, result.labels[labelIndex], referenceSize);
      } catch (const std::exception &e) {
        rendered.errorMessage = std::string("Rendering failed: ") + e.what();
      }
      rendered.key = output.key;
      rendered.fileName = output.fileName;

      if (rendered.success && !m_config.outputDir.empty()) {
        std::filesystem::path path =
            std::filesystem::path(m_config.outputDir) / rendered.fileName;
        std::string writeError;
        if (writeFile(path, rendered.pdfData, writeError)) {
          rendered.filePath = path.string();
        } else {
          rendered.success = false;
          rendered.errorMessage = writeError;
        }
        rendered.pdfData.clear();
      }

      if (rendered.success) {
        debug("Wrote " + rendered.fileName);
      } else {
        logLine("Failed to produce " + rendered.fileName + ": " +
                rendered.errorMessage);
      }
      output = std::move(rendered);
    }
  }

  if (isCancelled(cancel)) {
    result.cancelled = true;
  }
}

LabelOutput
LabelBatchProcessor::renderLabel(DocumentAccess &doc, const LabelPlan &plan,
                                 const ReferenceSizeCell &referenceSize) const {
  LabelOutput output;
  const Group &group = plan.group;

  std::vector<int> pages;
  if (m_config.duplicates == DuplicatePolicy::KeepAllPages) {
    pages = group.pageIndices;
  } else {
    pages.push_back(group.pageIndices.front());
  }

  RenderResult rendered;
  if (m_config.sizePolicy == SizePolicy::None &&
      m_config.duplicates == DuplicatePolicy::KeepAllPages) {
    // No normalization: keep the pages and only change their visible area
    output.outputSize =
        ReferenceSize{group.sharedRect.width(), group.sharedRect.height()};
    rendered = m_compositor->cropPagesInPlace(doc, pages, group.sharedRect,
                                              m_config.copies);
  } else {
    std::optional<ReferenceSize> size =
        m_normalizer.outputSize(group.sharedRect, referenceSize);
    if (!size) {
      output.errorMessage = "Reference size has not been established";
      return output;
    }
    output.outputSize = *size;
    rendered = m_compositor->renderCroppedPages(
        doc, pages, group.sharedRect, *size, m_config.copies);
  }

  output.success = rendered.success;
  output.errorMessage = rendered.errorMessage;
  output.pageCount = rendered.pageCount;
  output.pdfData = std::move(rendered.pdfData);
  return output;
}

} // namespace labelcrop
