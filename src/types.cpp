#include "sgrna_lib/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace sgrna_lib {

namespace {

bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(),
                                   [](unsigned char c) { return c >= '0' && c <= '9'; });
}

} // namespace

char complement_base(char c) {
  switch (c) {
    case 'A': return 'T';
    case 'T': return 'A';
    case 'C': return 'G';
    case 'G': return 'C';
    case 'a': return 't';
    case 't': return 'a';
    case 'c': return 'g';
    case 'g': return 'c';
    default: return c;
  }
}

std::string reverse_complement(const std::string &seq) {
  std::string out(seq.rbegin(), seq.rend());
  std::transform(out.begin(), out.end(), out.begin(), complement_base);
  return out;
}

std::string Target::key() const {
  std::string k;
  k.reserve(sequence.size() + pam.size() + chrom.size() + 32);
  k += sequence;
  k += '_';
  k += pam;
  k += '_';
  k += chrom;
  k += '_';
  k += std::to_string(start);
  k += '_';
  k += std::to_string(end);
  k += '_';
  k += reverse ? '-' : '+';
  return k;
}

Target parse_target_key(const std::string &key) {
  // sequence and pam never contain '_', coordinates and strand come last,
  // so whatever sits between them is the chromosome name.
  size_t p1 = key.find('_');
  size_t p2 = (p1 == std::string::npos) ? std::string::npos : key.find('_', p1 + 1);
  size_t q3 = key.rfind('_');
  size_t q2 = (q3 == std::string::npos || q3 == 0) ? std::string::npos : key.rfind('_', q3 - 1);
  size_t q1 = (q2 == std::string::npos || q2 == 0) ? std::string::npos : key.rfind('_', q2 - 1);
  if (p2 == std::string::npos || q1 == std::string::npos || q1 <= p2) {
    throw std::invalid_argument("Malformed target key: " + key);
  }
  Target t;
  t.sequence = key.substr(0, p1);
  t.pam = key.substr(p1 + 1, p2 - p1 - 1);
  t.chrom = key.substr(p2 + 1, q1 - p2 - 1);
  std::string start = key.substr(q1 + 1, q2 - q1 - 1);
  std::string end = key.substr(q2 + 1, q3 - q2 - 1);
  std::string strand = key.substr(q3 + 1);
  if (t.sequence.empty() || t.chrom.empty() || !all_digits(start) || !all_digits(end) ||
      (strand != "+" && strand != "-")) {
    throw std::invalid_argument("Malformed target key: " + key);
  }
  t.start = std::stoull(start);
  t.end = std::stoull(end);
  t.reverse = strand == "-";
  return t;
}

} // namespace sgrna_lib
