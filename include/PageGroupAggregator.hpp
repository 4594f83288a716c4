#ifndef PAGE_GROUP_AGGREGATOR_HPP
#define PAGE_GROUP_AGGREGATOR_HPP

#include "LabelGeometry.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace labelcrop {

/**
 * @brief All pages of one document sharing an identifier
 */
struct Group {
  Identifier key;                ///< Identifier shared by the pages
  int documentIndex = 0;         ///< Document the group was opened in
  std::vector<int> pageIndices;  ///< Pages in first-seen order, never empty
  Rect sharedRect;               ///< Crop rectangle from the first page
  int droppedDuplicates = 0;     ///< Same key seen in other documents
};

/**
 * @brief Groups pages by identifier, first occurrence wins
 *
 * Identifiers are unique for the lifetime of the aggregator, which is one
 * run over a batch of documents. The first page bearing an identifier opens
 * the group and is the only page whose crop rectangle is computed. Later
 * pages of the same document are recorded in the group; pages of other
 * documents are counted and dropped. Groups keep first-occurrence order.
 */
class PageGroupAggregator {
public:
  enum class Outcome {
    Skipped,  ///< Page had no identifier
    NewGroup, ///< Page opened a new group
    Duplicate ///< Identifier already seen
  };

  /**
   * @brief Offer one page in page order
   * @param documentIndex Index of the page's document in the batch
   * @param pageIndex 0-indexed page within the document
   * @param identifier Identifier read from the page, if any
   * @param rectForFirstPage Called only when the page opens a new group
   * @return What happened to the page
   */
  Outcome offer(int documentIndex, int pageIndex,
                const std::optional<Identifier> &identifier,
                const std::function<Rect()> &rectForFirstPage);

  const std::vector<Group> &groups() const { return m_groups; }

  /// Group for an identifier, or nullptr
  const Group *find(const Identifier &key) const;

  /// Number of offers that hit an identifier seen before
  int duplicateCount() const { return m_duplicates; }

  /**
   * @brief Group a single document's pages in one call
   * @param pages (pageIndex, identifier) pairs in page order
   * @param rectForPage Crop rectangle of a group-defining page
   */
  static std::vector<Group>
  aggregate(const std::vector<std::pair<int, std::optional<Identifier>>> &pages,
            const std::function<Rect(int)> &rectForPage);

private:
  std::vector<Group> m_groups;
  std::unordered_map<Identifier, size_t> m_index;
  int m_duplicates = 0;
};

} // namespace labelcrop

#endif // PAGE_GROUP_AGGREGATOR_HPP
