#include "sgrna_lib/annotator.hpp"
#include "sgrna_lib/targets.hpp"

#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

using namespace sgrna_lib;

namespace {

Target make_target(const std::string &chrom, uint64_t start, uint64_t end, bool reverse = false) {
  Target t;
  t.sequence = std::string(end - start, 'A');
  t.pam = "TGG";
  t.chrom = chrom;
  t.start = start;
  t.end = end;
  t.reverse = reverse;
  return t;
}

TargetMap make_map(const std::vector<Target> &ts) {
  TargetMap m;
  for (const auto &t : ts) m[t.key()] = t;
  return m;
}

const std::map<std::string, uint64_t> kLens = {{"chr1", 1000}, {"chr2", 500}};

std::vector<const AnnotatedTarget *> rows_for(const std::vector<AnnotatedTarget> &rows, const Target &t) {
  std::vector<const AnnotatedTarget *> out;
  for (const auto &r : rows) {
    if (r.target.key() == t.key()) out.push_back(&r);
  }
  return out;
}

} // namespace

TEST(Annotator, OffsetFollowsGeneStrand) {
  Target t = make_target("chr1", 110, 130);
  TargetMap targets = make_map({t});

  auto plus = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '+'}}, kLens, true);
  ASSERT_EQ(plus.size(), 1u);
  EXPECT_TRUE(plus[0].annotated);
  EXPECT_EQ(plus[0].gene, "g");
  EXPECT_EQ(plus[0].offset, 10);

  auto minus = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '-'}}, kLens, true);
  ASSERT_EQ(minus.size(), 1u);
  EXPECT_EQ(minus[0].offset, 70);
}

TEST(Annotator, SenseStrandComparesOrientations) {
  Target fwd = make_target("chr1", 110, 130, false);
  Target rev = make_target("chr1", 140, 160, true);
  TargetMap targets = make_map({fwd, rev});

  auto minus = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '-'}}, kLens, true);
  ASSERT_EQ(minus.size(), 2u);
  EXPECT_TRUE(rows_for(minus, rev)[0]->sense_strand);
  EXPECT_FALSE(rows_for(minus, fwd)[0]->sense_strand);

  auto plus = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '+'}}, kLens, true);
  EXPECT_FALSE(rows_for(plus, rev)[0]->sense_strand);
  EXPECT_TRUE(rows_for(plus, fwd)[0]->sense_strand);
}

TEST(Annotator, PartialOverlapClaimsStraddlingTargets) {
  Target left = make_target("chr1", 90, 110);
  Target inside = make_target("chr1", 110, 130);
  Target right = make_target("chr1", 190, 210);
  TargetMap targets = make_map({left, inside, right});
  auto rows = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '+'}}, kLens, true);
  ASSERT_EQ(rows.size(), 3u);
  for (const auto &r : rows) EXPECT_TRUE(r.annotated);
  EXPECT_EQ(rows_for(rows, left)[0]->offset, -10);
}

TEST(Annotator, FullOverlapRequiresContainment) {
  Target left = make_target("chr1", 90, 110);
  Target inside = make_target("chr1", 110, 130);
  Target right = make_target("chr1", 190, 210);
  TargetMap targets = make_map({left, inside, right});
  AnnotateStats stats;
  auto rows = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '+'}}, kLens, false, &stats);
  ASSERT_EQ(rows.size(), 3u);
  ASSERT_EQ(rows_for(rows, inside).size(), 1u);
  EXPECT_TRUE(rows_for(rows, inside)[0]->annotated);
  EXPECT_FALSE(rows_for(rows, left)[0]->annotated);
  EXPECT_FALSE(rows_for(rows, right)[0]->annotated);
  EXPECT_EQ(stats.annotated_rows, 1u);
  EXPECT_EQ(stats.unannotated_rows, 2u);
}

TEST(Annotator, PartialOverlapBoundaryArithmetic) {
  // A target ending exactly at the region start is still claimed; one
  // starting on the last base of the region is not.
  Target touching = make_target("chr1", 80, 100);
  Target last_base = make_target("chr1", 199, 219);
  TargetMap targets = make_map({touching, last_base});
  auto rows = annotate_targets(targets, {Region{"g", "chr1", 100, 200, '+'}}, kLens, true);
  EXPECT_TRUE(rows_for(rows, touching)[0]->annotated);
  EXPECT_FALSE(rows_for(rows, last_base)[0]->annotated);
}

TEST(Annotator, FullOverlapBoundaryArithmetic) {
  // A target starting one base before the region is still claimed; one
  // ending exactly at the region end is not.
  Target one_before = make_target("chr1", 100, 120);
  Target flush_end = make_target("chr1", 180, 200);
  TargetMap targets = make_map({one_before, flush_end});
  auto rows = annotate_targets(targets, {Region{"g", "chr1", 101, 200, '+'}}, kLens, false);
  ASSERT_EQ(rows.size(), 2u);
  ASSERT_TRUE(rows_for(rows, one_before)[0]->annotated);
  EXPECT_EQ(rows_for(rows, one_before)[0]->offset, -1);
  EXPECT_FALSE(rows_for(rows, flush_end)[0]->annotated);
}

TEST(Annotator, TargetsOverlappingSeveralRegionsFanOut) {
  Target shared = make_target("chr1", 150, 170);
  Target solo = make_target("chr1", 400, 420);
  Target lonely = make_target("chr2", 10, 30);
  TargetMap targets = make_map({shared, solo, lonely});
  std::vector<Region> regions = {
      {"a", "chr1", 100, 200, '+'},
      {"a", "chr1", 100, 200, '-'},
      {"b", "chr1", 140, 450, '+'},
  };
  auto rows = annotate_targets(targets, regions, kLens, true);

  auto shared_rows = rows_for(rows, shared);
  ASSERT_EQ(shared_rows.size(), 3u);
  for (const auto *r : shared_rows) EXPECT_TRUE(r->annotated);
  EXPECT_EQ(shared_rows[0]->offset, 50);
  EXPECT_EQ(shared_rows[1]->offset, 30);
  EXPECT_EQ(shared_rows[2]->gene, "b");

  ASSERT_EQ(rows_for(rows, solo).size(), 1u);
  EXPECT_EQ(rows_for(rows, solo)[0]->gene, "b");
  ASSERT_EQ(rows_for(rows, lonely).size(), 1u);
  EXPECT_FALSE(rows_for(rows, lonely)[0]->annotated);
}

TEST(Annotator, EveryTargetIsEitherAnnotatedOrEmittedOnce) {
  std::vector<Target> ts;
  for (uint64_t s = 0; s < 900; s += 37) ts.push_back(make_target("chr1", s, s + 20, (s / 37) % 2 == 1));
  for (uint64_t s = 0; s < 450; s += 53) ts.push_back(make_target("chr2", s, s + 20));
  TargetMap targets = make_map(ts);
  std::vector<Region> regions = {
      {"a", "chr1", 10, 120, '+'},
      {"b", "chr1", 100, 300, '-'},
      {"c", "chr1", 500, 520, '+'},
      {"d", "chr2", 200, 260, '+'},
      {"e", "chrX", 0, 10, '+'},
  };
  auto rows = annotate_targets(targets, regions, kLens, true);
  for (const auto &t : ts) {
    auto mine = rows_for(rows, t);
    ASSERT_FALSE(mine.empty()) << t.key();
    size_t unannotated = 0;
    for (const auto *r : mine) {
      if (!r->annotated) ++unannotated;
    }
    if (unannotated > 0) {
      EXPECT_EQ(mine.size(), 1u) << t.key();
    }
  }
}

TEST(Annotator, SkipsRegionsOnUnknownOrTooShortSequences) {
  TargetMap targets = make_map({make_target("chr1", 10, 30)});
  std::vector<Region> regions = {
      {"ghost", "chrX", 0, 50, '+'},
      {"past_end", "chr2", 600, 700, '+'},
      {"empty", "chr2", 10, 40, '+'},
  };
  AnnotateStats stats;
  auto rows = annotate_targets(targets, regions, kLens, true, &stats);
  EXPECT_EQ(stats.regions_seen, 3u);
  EXPECT_EQ(stats.regions_missing_chrom, 1u);
  EXPECT_EQ(stats.regions_out_of_bounds, 1u);
  EXPECT_EQ(stats.regions_without_targets, 1u);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_FALSE(rows[0].annotated);
}

TEST(Annotator, UnsortedRegionsAreRejected) {
  TargetMap targets = make_map({make_target("chr1", 10, 30)});
  std::vector<Region> regions = {
      {"late", "chr1", 300, 400, '+'},
      {"other", "chr2", 0, 10, '+'},
      {"early", "chr1", 0, 100, '+'},
  };
  EXPECT_THROW(annotate_targets(targets, regions, kLens, true), std::invalid_argument);
  sort_regions(regions);
  EXPECT_EQ(regions[0].gene, "early");
  EXPECT_EQ(regions[1].gene, "late");
  EXPECT_EQ(regions[2].gene, "other");
  EXPECT_NO_THROW(annotate_targets(targets, regions, kLens, true));
}

TEST(Annotator, InvalidStrandIsRejected) {
  TargetMap targets = make_map({make_target("chr1", 10, 30)});
  EXPECT_THROW(annotate_targets(targets, {Region{"g", "chr1", 0, 100, '.'}}, kLens, true),
               std::invalid_argument);
}

TEST(Annotator, SweepCursorOnlyMovesForward) {
  std::vector<Target> ts = {make_target("chr1", 0, 20), make_target("chr1", 50, 70),
                            make_target("chr1", 100, 120), make_target("chr1", 150, 170)};
  std::vector<const Target *> sorted;
  for (const auto &t : ts) sorted.push_back(&t);

  SweepCursor c = sweep_region(sorted, Region{"a", "chr1", 40, 110, '+'}, SweepCursor{}, true);
  EXPECT_EQ(c.front, 1u);
  EXPECT_EQ(c.back, 3u);
  EXPECT_EQ(c.last_start, 40u);

  SweepCursor d = sweep_region(sorted, Region{"b", "chr1", 130, 200, '+'}, c, true);
  EXPECT_EQ(d.front, 3u);
  EXPECT_EQ(d.back, 4u);
  EXPECT_GE(d.front, c.front);
  EXPECT_GE(d.back, c.back);
}

TEST(Annotator, CopiesAreIndependent) {
  Target t = make_target("chr1", 110, 130);
  TargetMap targets = make_map({t});
  std::vector<Region> regions = {{"a", "chr1", 100, 200, '+'}, {"b", "chr1", 105, 200, '+'}};
  auto rows = annotate_targets(targets, regions, kLens, true);
  ASSERT_EQ(rows.size(), 2u);
  rows[0].target.specificity = 99;
  rows[0].gene = "changed";
  EXPECT_EQ(rows[1].target.specificity, 0);
  EXPECT_EQ(rows[1].gene, "b");
  EXPECT_EQ(targets.begin()->second.specificity, 0);
}

TEST(Annotator, WholeChromosomeRegionAnnotatesExtractedTargets) {
  std::vector<SequenceRecord> genome = {{"chr1", "AAAATGGAAACGG"}};
  TargetMap targets = extract_targets(genome, ".GG", 4);
  ASSERT_EQ(targets.size(), 2u);
  std::map<std::string, uint64_t> lens = {{"chr1", 13}};
  auto rows = annotate_targets(targets, {Region{"whole", "chr1", 0, 13, '+'}}, lens, true);
  ASSERT_EQ(rows.size(), 2u);
  for (const auto &r : rows) {
    EXPECT_TRUE(r.annotated);
    EXPECT_EQ(r.gene, "whole");
    EXPECT_EQ(r.offset, static_cast<int64_t>(r.target.start));
    EXPECT_TRUE(r.sense_strand);
  }

  auto minus = annotate_targets(targets, {Region{"whole", "chr1", 0, 13, '-'}}, lens, true);
  for (const auto &r : minus) {
    EXPECT_EQ(r.offset, static_cast<int64_t>(13 - r.target.end));
    EXPECT_FALSE(r.sense_strand);
  }
}

TEST(Annotator, NestedRegionInheritsOuterWindow) {
  Target early = make_target("chr1", 10, 30);
  Target late = make_target("chr1", 200, 220);
  std::vector<Region> regions = {{"outer", "chr1", 0, 300, '+'}, {"inner", "chr1", 50, 100, '+'}};
  auto rows = annotate_targets(make_map({early, late}), regions, kLens, true);

  auto late_rows = rows_for(rows, late);
  ASSERT_EQ(late_rows.size(), 2u);
  EXPECT_EQ(late_rows[0]->gene, "outer");
  EXPECT_EQ(late_rows[1]->gene, "inner");
  EXPECT_EQ(late_rows[1]->offset, 150);
  EXPECT_EQ(rows_for(rows, early).size(), 1u);
}
