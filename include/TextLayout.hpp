#ifndef TEXT_LAYOUT_HPP
#define TEXT_LAYOUT_HPP

#include "LabelGeometry.hpp"

#include <string>
#include <vector>

namespace labelcrop {

/**
 * @brief Sort fragments top to bottom, then left to right
 *
 * Fragments whose top edges differ by at most yTolerance are treated as one
 * line and ordered by their left edge.
 */
void sortByPosition(std::vector<TextFragment> &fragments,
                    double yTolerance = 2.0);

/**
 * @brief Merge words sitting on the same line into line fragments
 *
 * Two words share a line when their vertical centers are within half the
 * taller word's height and the horizontal gap to the line built so far is
 * at most one line height. Merged text is joined with single spaces in
 * left-to-right order.
 */
std::vector<TextFragment> groupWordsIntoLines(std::vector<TextFragment> words);

/**
 * @brief Text of the fragments in reading order, one output line per line
 */
std::string joinInReadingOrder(std::vector<TextFragment> fragments,
                               double yTolerance = 2.0);

/// Words whose center lies inside clip, in their original order
std::vector<TextFragment> wordsInside(const std::vector<TextFragment> &words,
                                      const Rect &clip);

} // namespace labelcrop

#endif // TEXT_LAYOUT_HPP
