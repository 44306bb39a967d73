#include "sgrna_lib/report.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sgrna_lib {

namespace {

const char *py_bool(bool b) { return b ? "True" : "False"; }

} // namespace

std::string report_header() {
  return "target\tpam\tchrom\tstart\tend\treverse\tspecificity\tgene\toffset\tsense_strand";
}

std::string report_row(const AnnotatedTarget &row) {
  const Target &t = row.target;
  std::ostringstream os;
  os << t.sequence << '\t' << t.pam << '\t' << t.chrom << '\t' << t.start << '\t' << t.end
     << '\t' << py_bool(t.reverse) << '\t' << t.specificity << '\t';
  if (row.annotated) {
    os << row.gene << '\t' << row.offset << '\t' << py_bool(row.sense_strand);
  } else {
    os << "None\tNone\tNone";
  }
  return os.str();
}

void write_report(std::ostream &out, const std::vector<AnnotatedTarget> &rows) {
  out << report_header() << '\n';
  for (const auto &r : rows) out << report_row(r) << '\n';
}

void write_report_file(const std::string &path, const std::vector<AnnotatedTarget> &rows) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to open report for write: " + path);
  write_report(out, rows);
  out.flush();
  if (!out) throw std::runtime_error("Failed to write report: " + path);
}

} // namespace sgrna_lib
