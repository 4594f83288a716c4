#include "LabelAnalysis.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace labelcrop {

// ---------------------------------------------------------------------------
// ColumnClusterer
// ---------------------------------------------------------------------------

ColumnClusterer::ColumnClusterer(int columns, double paddingX, double paddingY)
    : m_columns(std::max(1, columns)), m_paddingX(paddingX),
      m_paddingY(paddingY) {}

ClusterAssignment ColumnClusterer::cluster(const std::vector<double> &xs,
                                           int k) {
  ClusterAssignment result;
  result.columnOf.assign(xs.size(), 0);

  if (xs.empty()) {
    return result;
  }

  auto range = std::minmax_element(xs.begin(), xs.end());
  double minX = *range.first;
  double maxX = *range.second;

  // One effective column: everything shares the midpoint center
  if (k <= 1 || maxX == minX) {
    result.centers.push_back((minX + maxX) / 2.0);
    return result;
  }

  double spacing = (maxX - minX) / (k - 1);
  result.centers.resize(k);
  for (int j = 0; j < k; j++) {
    result.centers[j] = minX + j * spacing;
  }

  std::vector<double> sums(k);
  std::vector<int> counts(k);

  for (int iteration = 0; iteration < kIterations; iteration++) {
    // Assign: strict '<' keeps the lowest index on distance ties
    for (size_t i = 0; i < xs.size(); i++) {
      int best = 0;
      double bestDistance = std::abs(xs[i] - result.centers[0]);
      for (int j = 1; j < k; j++) {
        double distance = std::abs(xs[i] - result.centers[j]);
        if (distance < bestDistance) {
          bestDistance = distance;
          best = j;
        }
      }
      result.columnOf[i] = best;
    }

    // Recompute: empty columns keep their previous center
    std::fill(sums.begin(), sums.end(), 0.0);
    std::fill(counts.begin(), counts.end(), 0);
    for (size_t i = 0; i < xs.size(); i++) {
      sums[result.columnOf[i]] += xs[i];
      counts[result.columnOf[i]]++;
    }
    for (int j = 0; j < k; j++) {
      if (counts[j] > 0) {
        result.centers[j] = sums[j] / counts[j];
      }
    }
  }

  return result;
}

Rect ColumnClusterer::fallbackRect(const PageDimensions &page) const {
  return Rect(0.0, 0.0, page.width / m_columns, page.height);
}

Rect ColumnClusterer::leftmostColumnRect(
    const std::vector<TextFragment> &fragments,
    const PageDimensions &page) const {
  std::vector<const TextFragment *> used;
  std::vector<double> xs;
  used.reserve(fragments.size());
  xs.reserve(fragments.size());

  for (const auto &fragment : fragments) {
    bool blank = std::all_of(fragment.text.begin(), fragment.text.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
      continue;
    }
    used.push_back(&fragment);
    xs.push_back(fragment.bbox.centerX());
  }

  if (xs.empty()) {
    return fallbackRect(page);
  }

  ClusterAssignment assignment = cluster(xs, m_columns);

  // Leftmost column is the one with the smallest final center
  int leftmost = static_cast<int>(
      std::min_element(assignment.centers.begin(), assignment.centers.end()) -
      assignment.centers.begin());

  double minX0 = std::numeric_limits<double>::max();
  double minY0 = std::numeric_limits<double>::max();
  double maxX1 = std::numeric_limits<double>::lowest();
  double maxY1 = std::numeric_limits<double>::lowest();
  bool hasMembers = false;

  for (size_t i = 0; i < used.size(); i++) {
    if (assignment.columnOf[i] != leftmost) {
      continue;
    }
    const Rect &box = used[i]->bbox;
    minX0 = std::min(minX0, box.x0);
    minY0 = std::min(minY0, box.y0);
    maxX1 = std::max(maxX1, box.x1);
    maxY1 = std::max(maxY1, box.y1);
    hasMembers = true;
  }

  if (!hasMembers) {
    return fallbackRect(page);
  }

  return Rect(minX0 - m_paddingX, minY0 - m_paddingY, maxX1 + m_paddingX,
              maxY1 + m_paddingY)
      .clampedTo(page);
}

// ---------------------------------------------------------------------------
// IdentifierExtractor
// ---------------------------------------------------------------------------

namespace {

const char *patternFor(IdentifierGrammar grammar) {
  switch (grammar) {
  case IdentifierGrammar::Sku:
    return R"(([A-Z])\s?(\d{5})\s+(\d{4})\s+(\d{4}))";
  case IdentifierGrammar::Referencia:
    return R"(REFERENCIA:\s*([A-Z0-9]+))";
  }
  return "";
}

} // namespace

IdentifierExtractor::IdentifierExtractor(IdentifierGrammar grammar)
    : m_grammar(grammar), m_pattern(patternFor(grammar)) {}

std::string IdentifierExtractor::normalizeWhitespace(const std::string &text) {
  std::istringstream stream(text);
  std::string token;
  std::string normalized;
  while (stream >> token) {
    if (!normalized.empty()) {
      normalized += ' ';
    }
    normalized += token;
  }
  return normalized;
}

std::optional<Identifier>
IdentifierExtractor::tryExtract(const std::string &text) const {
  std::string normalized = normalizeWhitespace(text);
  std::smatch match;
  if (!std::regex_search(normalized, match, m_pattern)) {
    return std::nullopt;
  }

  switch (m_grammar) {
  case IdentifierGrammar::Sku:
    // Letter and first group are always joined, whatever the input spacing
    return match[1].str() + match[2].str() + " " + match[3].str() + " " +
           match[4].str();
  case IdentifierGrammar::Referencia:
    return match[1].str();
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// BarcodeAnchorLocator
// ---------------------------------------------------------------------------

BarcodeAnchorLocator::BarcodeAnchorLocator(int minDigits)
    : m_minDigits(minDigits) {}

std::string BarcodeAnchorLocator::digitsOf(const std::string &text) {
  std::string digits;
  for (unsigned char c : text) {
    if (std::isdigit(c)) {
      digits += static_cast<char>(c);
    }
  }
  return digits;
}

std::optional<BarcodeAnchor>
BarcodeAnchorLocator::locate(const std::vector<TextFragment> &words) const {
  const TextFragment *best = nullptr;
  std::string bestDigits;

  for (const auto &word : words) {
    std::string digits = digitsOf(word.text);
    if (digits.size() > bestDigits.size()) {
      best = &word;
      bestDigits = std::move(digits);
    }
  }

  if (best == nullptr ||
      static_cast<int>(bestDigits.size()) < m_minDigits) {
    return std::nullopt;
  }

  BarcodeAnchor anchor;
  anchor.bbox = best->bbox;
  anchor.centerX = best->bbox.centerX();
  anchor.digits = bestDigits;
  return anchor;
}

// ---------------------------------------------------------------------------
// CropGeometryNormalizer
// ---------------------------------------------------------------------------

CropGeometryNormalizer::CropGeometryNormalizer(SizePolicy policy,
                                               ReferenceSize fixedReference)
    : m_policy(policy), m_fixedReference(fixedReference) {}

namespace {

// Shift [lo, lo + extent) inside [0, limit] without changing its extent.
// An extent larger than the limit cannot fit and becomes [0, limit].
std::pair<double, double> shiftInside(double lo, double extent,
                                      double limit) {
  if (extent >= limit) {
    return {0.0, limit};
  }
  if (lo < 0.0) {
    lo = 0.0;
  } else if (lo + extent > limit) {
    lo = limit - extent;
  }
  return {lo, lo + extent};
}

} // namespace

Rect CropGeometryNormalizer::barcodeCenteredWindow(double centerX, double top,
                                                   double width, double height,
                                                   const PageDimensions &page) {
  auto horizontal = shiftInside(centerX - width / 2.0, width, page.width);
  auto vertical = shiftInside(top, height, page.height);
  return Rect(horizontal.first, vertical.first, horizontal.second,
              vertical.second);
}

Rect CropGeometryNormalizer::normalize(
    const Rect &labelRegion, const std::optional<BarcodeAnchor> &anchor,
    const PageDimensions &page) const {
  if (m_policy != SizePolicy::FixedReference || !anchor) {
    return labelRegion;
  }
  return barcodeCenteredWindow(anchor->centerX, labelRegion.y0,
                               m_fixedReference.width,
                               m_fixedReference.height, page);
}

std::optional<ReferenceSize>
CropGeometryNormalizer::outputSize(const Rect &crop,
                                   const ReferenceSizeCell &cell) const {
  switch (m_policy) {
  case SizePolicy::FixedReference:
    return m_fixedReference;
  case SizePolicy::FirstSeen:
    return cell.get();
  case SizePolicy::None:
    return ReferenceSize{crop.width(), crop.height()};
  }
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// ContentMaskCropDetector
// ---------------------------------------------------------------------------

ContentMaskCropDetector::ContentMaskCropDetector(int intensityThreshold,
                                                 double targetAspectRatio)
    : m_threshold(intensityThreshold), m_targetRatio(targetAspectRatio) {}

std::optional<Rect>
ContentMaskCropDetector::contentBounds(const cv::Mat &raster) const {
  if (raster.empty()) {
    return std::nullopt;
  }

  cv::Mat gray;
  if (raster.channels() == 3) {
    cv::cvtColor(raster, gray, cv::COLOR_BGR2GRAY);
  } else if (raster.channels() == 4) {
    cv::cvtColor(raster, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = raster;
  }

  cv::Mat mask = gray < m_threshold;
  std::vector<cv::Point> points;
  cv::findNonZero(mask, points);
  if (points.empty()) {
    return std::nullopt;
  }

  cv::Rect bounds = cv::boundingRect(points);
  return Rect(bounds.x, bounds.y, bounds.x + bounds.width - 1,
              bounds.y + bounds.height - 1);
}

Rect ContentMaskCropDetector::expandToAspect(const Rect &box, double ratio) {
  double width = box.width();
  double height = box.height();

  bool tooWide =
      height > 0.0 ? (width / height > ratio) : (width > 0.0);

  Rect expanded = box;
  if (tooWide) {
    double newHeight = width / ratio;
    double centerY = box.centerY();
    expanded.y0 = centerY - newHeight / 2.0;
    expanded.y1 = centerY + newHeight / 2.0;
  } else {
    double newWidth = height * ratio;
    double centerX = box.centerX();
    expanded.x0 = centerX - newWidth / 2.0;
    expanded.x1 = centerX + newWidth / 2.0;
  }
  return expanded;
}

ContentCrop ContentMaskCropDetector::detect(const cv::Mat &raster,
                                            const PageDimensions &page) const {
  ContentCrop crop;
  PageDimensions rasterSize{static_cast<double>(raster.cols),
                            static_cast<double>(raster.rows)};

  std::optional<Rect> bounds = contentBounds(raster);
  crop.foundContent = bounds.has_value();
  Rect box = bounds ? *bounds : Rect(0.0, 0.0, rasterSize.width,
                                     rasterSize.height);

  crop.pixelBox = expandToAspect(box, m_targetRatio).clampedTo(rasterSize);

  double scaleX = rasterSize.width > 0 ? page.width / rasterSize.width : 0.0;
  double scaleY = rasterSize.height > 0 ? page.height / rasterSize.height : 0.0;
  crop.pageRect = Rect(crop.pixelBox.x0 * scaleX, crop.pixelBox.y0 * scaleY,
                       crop.pixelBox.x1 * scaleX, crop.pixelBox.y1 * scaleY);
  return crop;
}

cv::Mat ContentMaskCropDetector::renderPreview(const cv::Mat &raster,
                                               const Rect &pixelBox, int width,
                                               int height) {
  if (raster.empty() || width <= 0 || height <= 0) {
    return cv::Mat();
  }

  int x0 = static_cast<int>(std::lround(pixelBox.x0));
  int y0 = static_cast<int>(std::lround(pixelBox.y0));
  int x1 = static_cast<int>(std::lround(pixelBox.x1));
  int y1 = static_cast<int>(std::lround(pixelBox.y1));

  cv::Rect roi = cv::Rect(x0, y0, x1 - x0, y1 - y0) &
                 cv::Rect(0, 0, raster.cols, raster.rows);
  if (roi.empty()) {
    return cv::Mat();
  }

  cv::Mat preview;
  cv::resize(raster(roi), preview, cv::Size(width, height), 0, 0,
             cv::INTER_LANCZOS4);
  return preview;
}

} // namespace labelcrop
