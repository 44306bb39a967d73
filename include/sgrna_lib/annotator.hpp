#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "sgrna_lib/types.hpp"

namespace sgrna_lib {

struct AnnotateStats {
  size_t regions_seen{0};
  size_t regions_missing_chrom{0};
  size_t regions_out_of_bounds{0};
  size_t regions_without_targets{0};
  size_t annotated_rows{0};
  size_t unannotated_rows{0};
};

// Sweep state for one chromosome: the overlapping window is [front, back)
// of that chromosome's targets sorted by (start, end). Both indices only
// move forward; last_start tracks the region sort precondition.
struct SweepCursor {
  size_t front{0};
  size_t back{0};
  uint64_t last_start{0};
};

// Advance `cursor` past `region` over `sorted` (ascending (start, end)) and
// return the new cursor. Targets in [result.front, result.back) overlap.
SweepCursor sweep_region(const std::vector<const Target *> &sorted,
                         const Region &region,
                         SweepCursor cursor,
                         bool allow_partial_overlap);

// Annotate every target with the regions it overlaps.
//
// `regions` must be sorted by ascending start within each chromosome; a
// violation throws std::invalid_argument. Regions on chromosomes missing
// from `chrom_lengths`, or starting past the chromosome end, are skipped.
//
// A target overlapping k > 0 regions yields k annotated copies; a target
// overlapping none yields one unannotated copy.
//
// The window never shrinks, so a region nested inside a longer preceding
// region on the same chromosome also labels the outer region's targets that
// lie past its own end.
std::vector<AnnotatedTarget> annotate_targets(const TargetMap &targets,
                                              const std::vector<Region> &regions,
                                              const std::map<std::string, uint64_t> &chrom_lengths,
                                              bool allow_partial_overlap,
                                              AnnotateStats *stats = nullptr);

// Stable sort by (chrom, start), establishing annotate_targets' precondition.
void sort_regions(std::vector<Region> &regions);

} // namespace sgrna_lib
