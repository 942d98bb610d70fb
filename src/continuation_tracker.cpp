#include "continuation_tracker.hpp"

bool ContinuationTracker::setHeader(int slot, const DayHeader& header) {
  if (slot < 0 || slot >= kMaxColumnSlots) return false;
  slots_[slot] = header;
  return true;
}

std::optional<DayHeader> ContinuationTracker::boundHeader(int slot) const {
  if (slot < 0 || slot >= kMaxColumnSlots) return std::nullopt;
  return slots_[slot];
}
