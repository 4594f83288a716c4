#include "PageGroupAggregator.hpp"

namespace labelcrop {

PageGroupAggregator::Outcome
PageGroupAggregator::offer(int documentIndex, int pageIndex,
                           const std::optional<Identifier> &identifier,
                           const std::function<Rect()> &rectForFirstPage) {
  if (!identifier) {
    return Outcome::Skipped;
  }

  auto it = m_index.find(*identifier);
  if (it != m_index.end()) {
    Group &group = m_groups[it->second];
    if (group.documentIndex == documentIndex) {
      group.pageIndices.push_back(pageIndex);
    } else {
      group.droppedDuplicates++;
    }
    m_duplicates++;
    return Outcome::Duplicate;
  }

  Group group;
  group.key = *identifier;
  group.documentIndex = documentIndex;
  group.pageIndices.push_back(pageIndex);
  group.sharedRect = rectForFirstPage();

  m_index.emplace(group.key, m_groups.size());
  m_groups.push_back(std::move(group));
  return Outcome::NewGroup;
}

const Group *PageGroupAggregator::find(const Identifier &key) const {
  auto it = m_index.find(key);
  return it == m_index.end() ? nullptr : &m_groups[it->second];
}

std::vector<Group> PageGroupAggregator::aggregate(
    const std::vector<std::pair<int, std::optional<Identifier>>> &pages,
    const std::function<Rect(int)> &rectForPage) {
  PageGroupAggregator aggregator;
  for (const auto &page : pages) {
    int pageIndex = page.first;
    aggregator.offer(0, pageIndex, page.second,
                     [&rectForPage, pageIndex]() {
                       return rectForPage(pageIndex);
                     });
  }
  return aggregator.m_groups;
}

} // namespace labelcrop
