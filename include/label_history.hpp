// label_history.hpp
#pragma once

#include <vector>

#include "traffic_types.hpp"

namespace traffic {

// Fixed-capacity ring of the most recent congestion labels, oldest first.
class LabelHistory {
public:
  explicit LabelHistory(int capacity = 5);

  void push(CongestionLabel l);

  int size() const { return count_; }
  int capacity() const { return static_cast<int>(slots_.size()); }

  // i = 0 is the oldest retained label.
  CongestionLabel at(int i) const;

  // Least-squares slope of the label level over the retained labels, in
  // levels per sample. 0 with fewer than two labels.
  double slope() const;

  bool trending_down() const { return slope() < 0.0; }

  bool operator==(const LabelHistory& o) const;

private:
  int idx(int i) const { return (head_ + i) % capacity(); }

  std::vector<CongestionLabel> slots_;
  int head_ = 0;   // index of the oldest label
  int count_ = 0;
};

} // namespace traffic
