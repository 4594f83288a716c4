#ifndef LABEL_BATCH_PROCESSOR_HPP
#define LABEL_BATCH_PROCESSOR_HPP

#include "DocumentAccess.hpp"
#include "LabelAnalysis.hpp"
#include "LabelCropConfig.hpp"
#include "LabelRenderer.hpp"
#include "PageGroupAggregator.hpp"
#include "ReferenceSizeCell.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace labelcrop {

/**
 * @brief One label found by the analysis pass
 */
struct LabelPlan {
  Group group;              ///< Identifier, pages and shared crop rectangle
  std::string source;       ///< Source of the group's document
  PageDimensions pageSize;  ///< Size of the group-defining page
  Rect detectedRegion;      ///< Region before normalization
  bool anchored = false;    ///< Crop centered on barcode digits
};

/**
 * @brief Output produced for one label by the render pass
 */
struct LabelOutput {
  Identifier key;              ///< Identifier of the label
  std::string fileName;        ///< "<prefix> <identifier>.pdf"
  std::string filePath;        ///< Written file, empty when kept in memory
  std::string pdfData;         ///< PDF bytes when no output directory is set
  ReferenceSize outputSize;    ///< Output page size (points)
  int pageCount = 0;           ///< Pages in the output PDF
  bool success = false;        ///< Whether the output was produced
  std::string errorMessage;    ///< Error message if failed
};

/**
 * @brief A document that could not be processed
 */
struct DocumentFailure {
  std::string source;  ///< Document source as given to the batch
  std::string message; ///< What went wrong
};

/**
 * @brief Result of a run over a batch of documents
 *
 * A run reports partial success: labels and outputs are kept for every
 * document that could be processed, failures are listed alongside.
 */
struct BatchResult {
  bool success = false;                ///< At least partially successful
  std::vector<LabelPlan> labels;       ///< Labels in first-occurrence order
  std::vector<LabelOutput> outputs;    ///< Same order as labels (render pass)
  std::vector<DocumentFailure> failures;
  std::optional<ReferenceSize> referenceSize; ///< Output size of the run
  std::string previewPath;             ///< Written preview PNG, if any

  // Statistics
  int documentCount = 0;          ///< Documents opened successfully
  int pagesScanned = 0;           ///< Pages analyzed
  int pagesWithoutIdentifier = 0; ///< Pages skipped for lack of identifier
  int duplicatePages = 0;         ///< Pages whose identifier was seen before

  bool cancelled = false;      ///< Run stopped by the cancellation flag
  double processingTimeMs = 0; ///< Total processing time in milliseconds
};

/**
 * @brief Runs label detection, grouping and rendering over documents
 *
 * A run has two passes. The analysis pass walks documents and pages
 * sequentially in batch order, so the first label of the run is the one
 * that fixes the reference size under SizePolicy::FirstSeen. The render
 * pass then produces every output in parallel (one document per task),
 * reading the already established reference size.
 *
 * Example usage:
 * @code
 * labelcrop::LabelCropConfig config;
 * labelcrop::LabelBatchProcessor processor(
 *     config, labelcrop::PDFDocumentAccess::opener(),
 *     std::make_shared<labelcrop::PDFLabelRenderer>());
 * auto result = processor.process({"sheet1.pdf", "sheet2.pdf"});
 * @endcode
 */
class LabelBatchProcessor {
public:
  LabelBatchProcessor(const LabelCropConfig &config, DocumentOpener opener,
                      std::shared_ptr<LabelCompositor> compositor);

  /**
   * @brief Analysis pass only: find, read and group labels
   * @param sources Document sources in batch order
   * @param cancel Optional flag checked between pages
   */
  BatchResult analyze(const std::vector<std::string> &sources,
                      const std::atomic<bool> *cancel = nullptr) const;

  /**
   * @brief Analysis pass followed by the parallel render pass
   *
   * Outputs are written to LabelCropConfig::outputDir, or kept in
   * LabelOutput::pdfData when outputDir is empty.
   */
  BatchResult process(const std::vector<std::string> &sources,
                      const std::atomic<bool> *cancel = nullptr) const;

  const LabelCropConfig &getConfig() const { return m_config; }

private:
  void analyzePass(const std::vector<std::string> &sources,
                   ReferenceSizeCell &referenceSize, BatchResult &result,
                   const std::atomic<bool> *cancel) const;

  void analyzeByColumns(int documentIndex, const std::string &source,
                        DocumentAccess &doc, PageGroupAggregator &aggregator,
                        ReferenceSizeCell &referenceSize,
                        std::vector<LabelPlan> &plans, BatchResult &result,
                        const std::atomic<bool> *cancel) const;

  void analyzeByMask(int documentIndex, const std::string &source,
                     DocumentAccess &doc, PageGroupAggregator &aggregator,
                     ReferenceSizeCell &referenceSize,
                     std::vector<LabelPlan> &plans, BatchResult &result,
                     const std::atomic<bool> *cancel) const;

  void renderPass(const std::vector<std::string> &sources,
                  const ReferenceSizeCell &referenceSize, BatchResult &result,
                  const std::atomic<bool> *cancel) const;

  LabelOutput renderLabel(DocumentAccess &doc, const LabelPlan &plan,
                          const ReferenceSizeCell &referenceSize) const;

  void debug(const std::string &message) const;

  LabelCropConfig m_config;
  DocumentOpener m_opener;
  std::shared_ptr<LabelCompositor> m_compositor;

  ColumnClusterer m_clusterer;
  IdentifierExtractor m_extractor;
  BarcodeAnchorLocator m_locator;
  CropGeometryNormalizer m_normalizer;
  ContentMaskCropDetector m_detector;
};

/// True when the flag is set
inline bool isCancelled(const std::atomic<bool> *cancel) {
  return cancel != nullptr && cancel->load(std::memory_order_relaxed);
}

} // namespace labelcrop

#endif // LABEL_BATCH_PROCESSOR_HPP
