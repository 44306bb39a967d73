#include "sgrna_lib/report.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace sgrna_lib;

namespace {

Target sample_target() {
  Target t;
  t.sequence = "ACGTACGTACGTACGTACGT";
  t.pam = "AGG";
  t.chrom = "chr1";
  t.start = 10;
  t.end = 30;
  t.reverse = true;
  t.specificity = 30;
  return t;
}

} // namespace

TEST(Report, HeaderNamesEveryColumn) {
  EXPECT_EQ(report_header(),
            "target\tpam\tchrom\tstart\tend\treverse\tspecificity\tgene\toffset\tsense_strand");
}

TEST(Report, AnnotatedRow) {
  AnnotatedTarget a;
  a.target = sample_target();
  a.annotated = true;
  a.gene = "b0001";
  a.offset = -4;
  a.sense_strand = true;
  EXPECT_EQ(report_row(a), "ACGTACGTACGTACGTACGT\tAGG\tchr1\t10\t30\tTrue\t30\tb0001\t-4\tTrue");
}

TEST(Report, UnannotatedRowUsesNone) {
  AnnotatedTarget a;
  a.target = sample_target();
  a.target.reverse = false;
  a.target.specificity = 0;
  EXPECT_EQ(report_row(a), "ACGTACGTACGTACGTACGT\tAGG\tchr1\t10\t30\tFalse\t0\tNone\tNone\tNone");
}

TEST(Report, WritesHeaderThenRows) {
  AnnotatedTarget a;
  a.target = sample_target();
  std::ostringstream os;
  write_report(os, {a, a});
  std::string text = os.str();
  EXPECT_EQ(text.substr(0, report_header().size() + 1), report_header() + "\n");
  EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 3);

  testing_util::TempDir dir;
  write_report_file(dir.file("out.tsv"), {a});
  EXPECT_EQ(testing_util::read_lines(dir.file("out.tsv")).size(), 2u);
  EXPECT_THROW(write_report_file(dir.file("missing/out.tsv"), {a}), std::runtime_error);
}
