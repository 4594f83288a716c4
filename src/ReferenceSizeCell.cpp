#include "ReferenceSizeCell.hpp"

namespace labelcrop {

bool ReferenceSizeCell::trySet(const ReferenceSize &size) {
  int expected = Unset;
  if (!m_state.compare_exchange_strong(expected, Writing,
                                       std::memory_order_acquire)) {
    return false;
  }
  m_value = size;
  m_state.store(Set, std::memory_order_release);
  return true;
}

std::optional<ReferenceSize> ReferenceSizeCell::get() const {
  if (m_state.load(std::memory_order_acquire) != Set) {
    return std::nullopt;
  }
  return m_value;
}

bool ReferenceSizeCell::isSet() const {
  return m_state.load(std::memory_order_acquire) == Set;
}

} // namespace labelcrop
