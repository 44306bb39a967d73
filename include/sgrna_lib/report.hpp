#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "sgrna_lib/types.hpp"

namespace sgrna_lib {

std::string report_header();
// One tab-separated row; unset annotation fields print as "None".
std::string report_row(const AnnotatedTarget &row);

void write_report(std::ostream &out, const std::vector<AnnotatedTarget> &rows);
void write_report_file(const std::string &path, const std::vector<AnnotatedTarget> &rows);

} // namespace sgrna_lib
