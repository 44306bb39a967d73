#pragma once

#include <string>
#include <vector>
#include "sgrna_lib/aligner.hpp"
#include "sgrna_lib/types.hpp"

namespace sgrna_lib {

struct ScorerParams {
  // Most permissive first; a target keeps the first tolerance at which it
  // aligns uniquely.
  std::vector<int> tolerances{39, 30, 20, 11, 1};
  int seed_mismatches{3};
  int seed_length{15};
  // Per-base qualities for the synthetic reads (PAM end first).
  std::string quality{"I4!=======44444++++++++"};
};

class SpecificityScorer {
public:
  SpecificityScorer(Aligner &aligner, ScorerParams params = {});

  // Raises each target's specificity to the tolerance of the first round in
  // which it aligned uniquely. Targets already above 0 are not resubmitted.
  // An AlignerError aborts the remaining rounds; tiers assigned so far stay.
  void score(TargetMap &targets) const;

  // Synthetic reads for every target still at specificity 0.
  std::vector<ReadRecord> build_batch(const TargetMap &targets) const;

  const ScorerParams &params() const { return params_; }

private:
  Aligner &aligner_;
  ScorerParams params_;
};

// `quality` cut or padded with '+' to `length` characters.
std::string fit_quality(const std::string &quality, size_t length);

} // namespace sgrna_lib
