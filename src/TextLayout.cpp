#include "TextLayout.hpp"

#include <algorithm>
#include <cmath>

namespace labelcrop {

namespace {

// Split position-sorted fragments into runs sharing a line
std::vector<std::vector<TextFragment>>
splitIntoLines(std::vector<TextFragment> fragments, double yTolerance) {
  std::stable_sort(fragments.begin(), fragments.end(),
                   [](const TextFragment &a, const TextFragment &b) {
                     return a.bbox.y0 < b.bbox.y0;
                   });

  std::vector<std::vector<TextFragment>> lines;
  double lineTop = 0.0;
  for (auto &fragment : fragments) {
    if (lines.empty() || fragment.bbox.y0 - lineTop > yTolerance) {
      lines.emplace_back();
      lineTop = fragment.bbox.y0;
    }
    lines.back().push_back(std::move(fragment));
  }

  for (auto &line : lines) {
    std::stable_sort(line.begin(), line.end(),
                     [](const TextFragment &a, const TextFragment &b) {
                       return a.bbox.x0 < b.bbox.x0;
                     });
  }
  return lines;
}

} // namespace

void sortByPosition(std::vector<TextFragment> &fragments, double yTolerance) {
  auto lines = splitIntoLines(std::move(fragments), yTolerance);
  fragments.clear();
  for (auto &line : lines) {
    for (auto &fragment : line) {
      fragments.push_back(std::move(fragment));
    }
  }
}

std::vector<TextFragment> groupWordsIntoLines(std::vector<TextFragment> words) {
  sortByPosition(words);

  std::vector<TextFragment> lines;
  std::vector<bool> used(words.size(), false);

  for (size_t i = 0; i < words.size(); i++) {
    if (used[i]) {
      continue;
    }
    used[i] = true;

    Rect lineBox = words[i].bbox;
    std::vector<size_t> members{i};

    for (size_t j = i + 1; j < words.size(); j++) {
      if (used[j]) {
        continue;
      }
      const Rect &candidate = words[j].bbox;

      double tolerance =
          std::max(candidate.height(), lineBox.height()) / 2.0;
      double yDiff = std::abs(candidate.centerY() - lineBox.centerY());

      double gap;
      if (candidate.x0 > lineBox.x1) {
        gap = candidate.x0 - lineBox.x1;
      } else if (lineBox.x0 > candidate.x1) {
        gap = lineBox.x0 - candidate.x1;
      } else {
        gap = 0.0; // overlapping
      }

      // Column gutters on label sheets are wider than one line height,
      // word spaces are not
      if (yDiff <= tolerance &&
          gap <= std::max(candidate.height(), lineBox.height())) {
        used[j] = true;
        members.push_back(j);
        lineBox.x0 = std::min(lineBox.x0, candidate.x0);
        lineBox.y0 = std::min(lineBox.y0, candidate.y0);
        lineBox.x1 = std::max(lineBox.x1, candidate.x1);
        lineBox.y1 = std::max(lineBox.y1, candidate.y1);
      }
    }

    std::sort(members.begin(), members.end(), [&words](size_t a, size_t b) {
      return words[a].bbox.x0 < words[b].bbox.x0;
    });

    TextFragment line;
    line.bbox = lineBox;
    for (size_t index : members) {
      if (!line.text.empty()) {
        line.text += ' ';
      }
      line.text += words[index].text;
    }
    lines.push_back(std::move(line));
  }

  return lines;
}

std::string joinInReadingOrder(std::vector<TextFragment> fragments,
                               double yTolerance) {
  std::string text;
  for (const auto &line : splitIntoLines(std::move(fragments), yTolerance)) {
    std::string lineText;
    for (const auto &fragment : line) {
      if (!lineText.empty()) {
        lineText += ' ';
      }
      lineText += fragment.text;
    }
    text += lineText;
    text += '\n';
  }
  return text;
}

std::vector<TextFragment> wordsInside(const std::vector<TextFragment> &words,
                                      const Rect &clip) {
  std::vector<TextFragment> inside;
  for (const auto &word : words) {
    if (clip.contains(word.bbox.centerX(), word.bbox.centerY())) {
      inside.push_back(word);
    }
  }
  return inside;
}

} // namespace labelcrop
