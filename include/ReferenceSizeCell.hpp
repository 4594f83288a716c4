#ifndef REFERENCE_SIZE_CELL_HPP
#define REFERENCE_SIZE_CELL_HPP

#include "LabelGeometry.hpp"

#include <atomic>
#include <optional>

namespace labelcrop {

/**
 * @brief Single-assignment holder of a run's reference output size
 *
 * Unset at construction, set by exactly one successful trySet(), read-only
 * afterwards. Concurrent writers race on a compare-and-set; losers leave
 * the stored value untouched. A reader sees either nothing or the complete
 * value.
 */
class ReferenceSizeCell {
public:
  ReferenceSizeCell() = default;

  ReferenceSizeCell(const ReferenceSizeCell &) = delete;
  ReferenceSizeCell &operator=(const ReferenceSizeCell &) = delete;

  /**
   * @brief Store the size if no size was stored before
   * @return true if this call set the value
   */
  bool trySet(const ReferenceSize &size);

  /// Stored size, or std::nullopt while unset
  std::optional<ReferenceSize> get() const;

  bool isSet() const;

private:
  enum State : int { Unset = 0, Writing = 1, Set = 2 };

  std::atomic<int> m_state{Unset};
  ReferenceSize m_value;
};

} // namespace labelcrop

#endif // REFERENCE_SIZE_CELL_HPP
