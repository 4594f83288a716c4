#include "DocumentAccess.hpp"

#include "TextLayout.hpp"

namespace labelcrop {

std::vector<TextFragment> DocumentAccess::getTextFragments(int pageIndex) {
  return groupWordsIntoLines(pageWords(pageIndex));
}

cv::Mat DocumentAccess::getRasterGray(int pageIndex, double zoom) {
  cv::Mat raster = getRaster(pageIndex, zoom);
  if (raster.empty() || raster.channels() == 1) {
    return raster;
  }

  cv::Mat gray;
  if (raster.channels() == 4) {
    cv::cvtColor(raster, gray, cv::COLOR_BGRA2GRAY);
  } else {
    cv::cvtColor(raster, gray, cv::COLOR_BGR2GRAY);
  }
  return gray;
}

std::vector<TextFragment> DocumentAccess::getWords(int pageIndex,
                                                   const Rect &clip) {
  return wordsInside(pageWords(pageIndex), clip);
}

std::string DocumentAccess::getText(int pageIndex, const Rect &clip) {
  return joinInReadingOrder(getWords(pageIndex, clip));
}

std::string DocumentAccess::getText(int pageIndex) {
  return joinInReadingOrder(pageWords(pageIndex));
}

} // namespace labelcrop
