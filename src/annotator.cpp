#include "sgrna_lib/annotator.hpp"
#include "sgrna_lib/log.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace sgrna_lib {

SweepCursor sweep_region(const std::vector<const Target *> &sorted,
                         const Region &region,
                         SweepCursor cursor,
                         bool allow_partial_overlap) {
  const size_t n = sorted.size();
  if (allow_partial_overlap) {
    // back stops at the first target with start + 1 >= region.end
    while (cursor.back < n && sorted[cursor.back]->start + 1 < region.end) ++cursor.back;
    // front stops at the first target with end >= region.start
    while (cursor.front < n && sorted[cursor.front]->end + 1 <= region.start) ++cursor.front;
  } else {
    // back stops at the first target with end >= region.end
    while (cursor.back < n && sorted[cursor.back]->end + 1 <= region.end) ++cursor.back;
    // front stops at the first target with start + 1 >= region.start
    while (cursor.front < n && sorted[cursor.front]->start + 1 < region.start) ++cursor.front;
  }
  cursor.last_start = region.start;
  return cursor;
}

void sort_regions(std::vector<Region> &regions) {
  std::stable_sort(regions.begin(), regions.end(), [](const Region &a, const Region &b) {
    if (a.chrom != b.chrom) return a.chrom < b.chrom;
    return a.start < b.start;
  });
}

std::vector<AnnotatedTarget> annotate_targets(const TargetMap &targets,
                                              const std::vector<Region> &regions,
                                              const std::map<std::string, uint64_t> &chrom_lengths,
                                              bool allow_partial_overlap,
                                              AnnotateStats *stats) {
  ScopedTimer timer("annotate_targets", timing_enabled());
  log_info("Labeling targets against ", regions.size(), " regions.");
  AnnotateStats local;
  AnnotateStats &st = stats ? *stats : local;
  st = AnnotateStats{};

  std::unordered_map<std::string, std::vector<const Target *>> per_chrom;
  for (const auto &kv : targets) per_chrom[kv.second.chrom].push_back(&kv.second);
  for (auto &kv : per_chrom) {
    std::sort(kv.second.begin(), kv.second.end(), [](const Target *a, const Target *b) {
      if (a->start != b->start) return a->start < b->start;
      return a->end < b->end;
    });
  }
  const std::vector<const Target *> no_targets;

  std::map<std::string, SweepCursor> cursors;
  std::set<const Target *> found;
  std::vector<AnnotatedTarget> out;

  for (size_t i = 0; i < regions.size(); ++i) {
    const Region &region = regions[i];
    ++st.regions_seen;
    if (i % 100 == 0) log_debug("Examining gene ", i, " [", region.gene, "].");
    if (region.strand != '+' && region.strand != '-') {
      throw std::invalid_argument("Region " + region.gene + " has invalid strand '" +
                                  std::string(1, region.strand) + "'");
    }
    auto len = chrom_lengths.find(region.chrom);
    if (len == chrom_lengths.end()) {
      log_warn("Region ", region.gene, " is on unknown sequence ", region.chrom, "; skipped.");
      ++st.regions_missing_chrom;
      continue;
    }

    auto cur = cursors.find(region.chrom);
    SweepCursor cursor = (cur == cursors.end()) ? SweepCursor{} : cur->second;
    if (cur != cursors.end() && region.start < cursor.last_start) {
      throw std::invalid_argument("Regions are not sorted by start on " + region.chrom +
                                  ": " + region.gene + " starts at " + std::to_string(region.start) +
                                  " after a region starting at " + std::to_string(cursor.last_start));
    }
    if (region.start >= len->second) {
      ++st.regions_out_of_bounds;
      continue;
    }

    auto pc = per_chrom.find(region.chrom);
    const auto &chrom_targets = (pc == per_chrom.end()) ? no_targets : pc->second;
    cursor = sweep_region(chrom_targets, region, cursor, allow_partial_overlap);
    cursors[region.chrom] = cursor;

    if (cursor.front >= cursor.back) {
      log_warn("No overlapping targets for gene ", region.gene, ".");
      ++st.regions_without_targets;
      continue;
    }
    const bool reverse_strand_gene = region.strand == '-';
    for (size_t k = cursor.front; k < cursor.back; ++k) {
      const Target *t = chrom_targets[k];
      found.insert(t);
      AnnotatedTarget a;
      a.target = *t;
      a.annotated = true;
      a.gene = region.gene;
      a.offset = reverse_strand_gene
                     ? static_cast<int64_t>(region.end) - static_cast<int64_t>(t->end)
                     : static_cast<int64_t>(t->start) - static_cast<int64_t>(region.start);
      a.sense_strand = reverse_strand_gene == t->reverse;
      out.push_back(std::move(a));
      ++st.annotated_rows;
    }
  }

  for (const auto &kv : targets) {
    if (found.count(&kv.second)) continue;
    AnnotatedTarget a;
    a.target = kv.second;
    out.push_back(std::move(a));
    ++st.unannotated_rows;
  }
  return out;
}

} // namespace sgrna_lib
