#ifndef LABEL_CROP_CONFIG_HPP
#define LABEL_CROP_CONFIG_HPP

#include <optional>
#include <string>

namespace labelcrop {

/**
 * @brief How the label region of a page is located
 */
enum class DetectionStrategy {
  TextColumns, ///< Per page: cluster text fragments into columns, keep the
               ///< leftmost column
  ContentMask  ///< Per document: bound the dark pixels of the first page
};

/**
 * @brief Structured code printed on a label
 */
enum class IdentifierGrammar {
  Sku,       ///< "C50039 0007 0001" (letter, 5 digits, 4 digits, 4 digits)
  Referencia ///< "REFERENCIA: C400080003XX"
};

/**
 * @brief Policy deciding the crop window and the output page size
 */
enum class SizePolicy {
  FixedReference, ///< Barcode-centered window of a fixed reference size
  FirstSeen,      ///< First label of the run fixes the output size
  None            ///< No normalization, output size = detected region
};

/**
 * @brief What happens to later pages bearing an identifier already seen
 */
enum class DuplicatePolicy {
  FirstOnly,   ///< One output page built from the first occurrence
  KeepAllPages ///< Output holds every page of the defining document that
               ///< bears the identifier, all cropped to the shared rect
};

/**
 * @brief Configuration of a label cropping run
 */
struct LabelCropConfig {
  DetectionStrategy detection = DetectionStrategy::TextColumns;
  IdentifierGrammar grammar = IdentifierGrammar::Sku;
  SizePolicy sizePolicy = SizePolicy::FixedReference;
  DuplicatePolicy duplicates = DuplicatePolicy::FirstOnly;

  // Column clustering
  int columns = 3;  ///< Labels across one page
  int paddingX = 5; ///< Horizontal padding around the column, page units
  int paddingY = 8; ///< Vertical padding around the column, page units

  int minBarcodeDigits = 8; ///< Shorter digit runs are not barcode text

  // Content mask detection
  double targetAspectRatio = 680.0 / 480.0; ///< width / height
  int intensityThreshold = 250; ///< Pixels darker than this are content
  double rasterZoom = 2.0;      ///< Raster scale relative to 72 DPI

  // Reference label size in points (FixedReference policy)
  double referenceWidth = 82.68998718261719;
  double referenceHeight = 78.56026458740234;

  // Output
  int copies = 1;           ///< Pages per output file for each source page
  std::string outputPrefix = "CHILE BARCODE HANGTAG";
  std::string outputDir = "labels";
  std::string previewPath;     ///< Crop preview PNG (mask mode), empty = off
  int previewWidth = 680;      ///< Preview size in pixels
  int previewHeight = 480;

  // Text layer fallback
  bool ocrFallback = false;  ///< OCR pages that have no text layer
  std::string tessDataPath;  ///< Empty = TESSDATA_PREFIX or default
  std::string language = "eng";

  int threads = 0; ///< Render pass threads (0 = OpenMP default)
  bool verbose = false;
};

/**
 * @brief Check a configuration for values no run can work with
 * @return Error message, or std::nullopt when the configuration is usable
 */
std::optional<std::string> validateConfig(const LabelCropConfig &config);

std::optional<DetectionStrategy> detectionFromName(const std::string &name);
std::optional<IdentifierGrammar> grammarFromName(const std::string &name);
std::optional<SizePolicy> sizePolicyFromName(const std::string &name);
std::optional<DuplicatePolicy> duplicatePolicyFromName(const std::string &name);

const char *detectionName(DetectionStrategy strategy);
const char *grammarName(IdentifierGrammar grammar);
const char *sizePolicyName(SizePolicy policy);
const char *duplicatePolicyName(DuplicatePolicy policy);

} // namespace labelcrop

#endif // LABEL_CROP_CONFIG_HPP
