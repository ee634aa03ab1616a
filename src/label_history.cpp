// label_history.cpp
#include "label_history.hpp"

#include <algorithm>

namespace traffic {

LabelHistory::LabelHistory(int capacity)
  : slots_(static_cast<size_t>(std::max(1, capacity)), CongestionLabel::Low) {}

void LabelHistory::push(CongestionLabel l) {
  if (count_ < capacity()) {
    slots_[idx(count_)] = l;
    ++count_;
    return;
  }
  // Full: overwrite the oldest and move head forward.
  slots_[head_] = l;
  head_ = (head_ + 1) % capacity();
}

CongestionLabel LabelHistory::at(int i) const {
  return slots_[idx(i)];
}

double LabelHistory::slope() const {
  if (count_ < 2) return 0.0;

  const double n = count_;
  const double mean_x = (n - 1.0) / 2.0;
  double mean_y = 0.0;
  for (int i = 0; i < count_; ++i) mean_y += label_level(at(i));
  mean_y /= n;

  double sxy = 0.0, sxx = 0.0;
  for (int i = 0; i < count_; ++i) {
    const double dx = i - mean_x;
    sxy += dx * (label_level(at(i)) - mean_y);
    sxx += dx * dx;
  }
  return sxy / sxx;
}

bool LabelHistory::operator==(const LabelHistory& o) const {
  if (count_ != o.count_ || capacity() != o.capacity()) return false;
  for (int i = 0; i < count_; ++i) {
    if (at(i) != o.at(i)) return false;
  }
  return true;
}

} // namespace traffic
