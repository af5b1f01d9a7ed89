/*
  Copyright 2010-202x held jointly by participating institutions.
  Phreatic is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Per-outer-iteration diagnostics of one time step.

#ifndef PHREATIC_ITERATION_HISTORY_HH_
#define PHREATIC_ITERATION_HISTORY_HH_

#include <ostream>
#include <vector>

#include "Key.hh"
#include "SolutionMap.hh"

namespace Phreatic {
namespace PhreaticSolvers {

struct IterationRecord {
  int outer_itr = 0;
  int inner_itr = 0;
  int total_inner_itr = 0;
  double max_change = 0.0; // signed, before damping
  DofLocation location;
  int linear_code = 0;
  double residual = 0.0;
  double relaxation = 1.0;
};


class IterationHistory {
 public:
  IterationHistory(){};

  void Reset() { records_.clear(); }
  void Add(const IterationRecord& record) { records_.push_back(record); }

  int size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }
  const IterationRecord& operator[](int i) const { return records_[i]; }
  const IterationRecord& back() const { return records_.back(); }
  const std::vector<IterationRecord>& records() const { return records_; }

  // Table of the records. Locations are printed with the block names, when
  // given, and with one-based cell numbers.
  void Write(std::ostream& os, const KeyVector& block_names = KeyVector()) const;

 private:
  std::vector<IterationRecord> records_;
};

} // namespace PhreaticSolvers
} // namespace Phreatic

#endif
