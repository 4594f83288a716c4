#include "LabelCropConfig.hpp"

#include <algorithm>
#include <cctype>

namespace labelcrop {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

std::optional<std::string> validateConfig(const LabelCropConfig &config) {
  if (config.columns < 1) {
    return "columns must be at least 1 (got " +
           std::to_string(config.columns) + ")";
  }
  if (config.paddingX < 0 || config.paddingY < 0) {
    return std::string("padding must not be negative");
  }
  if (config.minBarcodeDigits < 1) {
    return std::string("minimum barcode digits must be at least 1");
  }
  if (!(config.targetAspectRatio > 0.0)) {
    return std::string("target aspect ratio must be positive");
  }
  if (config.intensityThreshold < 0 || config.intensityThreshold > 255) {
    return "intensity threshold must be within 0..255 (got " +
           std::to_string(config.intensityThreshold) + ")";
  }
  if (!(config.rasterZoom > 0.0)) {
    return std::string("raster zoom must be positive");
  }
  if (!(config.referenceWidth > 0.0) || !(config.referenceHeight > 0.0)) {
    return std::string("reference size must be positive");
  }
  if (config.copies < 1 || config.copies > 999) {
    return "copies must be within 1..999 (got " +
           std::to_string(config.copies) + ")";
  }
  if (config.previewWidth < 1 || config.previewHeight < 1) {
    return std::string("preview size must be positive");
  }
  if (config.threads < 0) {
    return std::string("thread count must not be negative");
  }
  return std::nullopt;
}

std::optional<DetectionStrategy> detectionFromName(const std::string &name) {
  std::string key = toLower(name);
  if (key == "columns" || key == "text") {
    return DetectionStrategy::TextColumns;
  }
  if (key == "mask" || key == "content") {
    return DetectionStrategy::ContentMask;
  }
  return std::nullopt;
}

std::optional<IdentifierGrammar> grammarFromName(const std::string &name) {
  std::string key = toLower(name);
  if (key == "sku") {
    return IdentifierGrammar::Sku;
  }
  if (key == "referencia" || key == "ref") {
    return IdentifierGrammar::Referencia;
  }
  return std::nullopt;
}

std::optional<SizePolicy> sizePolicyFromName(const std::string &name) {
  std::string key = toLower(name);
  if (key == "fixed") {
    return SizePolicy::FixedReference;
  }
  if (key == "first") {
    return SizePolicy::FirstSeen;
  }
  if (key == "none") {
    return SizePolicy::None;
  }
  return std::nullopt;
}

std::optional<DuplicatePolicy> duplicatePolicyFromName(const std::string &name) {
  std::string key = toLower(name);
  if (key == "first") {
    return DuplicatePolicy::FirstOnly;
  }
  if (key == "all") {
    return DuplicatePolicy::KeepAllPages;
  }
  return std::nullopt;
}

const char *detectionName(DetectionStrategy strategy) {
  switch (strategy) {
  case DetectionStrategy::TextColumns:
    return "columns";
  case DetectionStrategy::ContentMask:
    return "mask";
  }
  return "unknown";
}

const char *grammarName(IdentifierGrammar grammar) {
  switch (grammar) {
  case IdentifierGrammar::Sku:
    return "sku";
  case IdentifierGrammar::Referencia:
    return "referencia";
  }
  return "unknown";
}

const char *sizePolicyName(SizePolicy policy) {
  switch (policy) {
  case SizePolicy::FixedReference:
    return "fixed";
  case SizePolicy::FirstSeen:
    return "first";
  case SizePolicy::None:
    return "none";
  }
  return "unknown";
}

const char *duplicatePolicyName(DuplicatePolicy policy) {
  switch (policy) {
  case DuplicatePolicy::FirstOnly:
    return "first";
  case DuplicatePolicy::KeepAllPages:
    return "all";
  }
  return "unknown";
}

} // namespace labelcrop
