#pragma once

#include "column_layout.hpp"
#include "day_header.hpp"

#include <array>
#include <optional>

// Date bound to each column slot during one traversal. A slot starts unset and, once a
// header binds it, only ever moves to a newer header.
class ContinuationTracker {
 public:
  // Returns false for a slot outside [0, 7).
  bool setHeader(int slot, const DayHeader& header);

  // Header inherited by a block without one; empty if the slot was never bound.
  std::optional<DayHeader> boundHeader(int slot) const;
  bool isBound(int slot) const { return boundHeader(slot).has_value(); }

 private:
  std::array<std::optional<DayHeader>, kMaxColumnSlots> slots_;
};
