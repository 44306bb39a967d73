#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "sgrna_lib/types.hpp"

namespace sgrna_lib {

// Longest protospacer extract_targets accepts.
constexpr uint32_t kMaxTargetLength = 1000;

// PAM patterns are written one symbol per base: IUPAC codes, '.', or a
// bracketed class such as [AG]. Case-insensitive.
std::vector<std::string> parse_pam(const std::string &pam);

// Number of bases a PAM pattern spans.
size_t pam_length(const std::string &pam);

// Symbol-wise reverse complement, e.g. "NGG" -> "CCN", "[AG]G" -> "C[TC]".
std::string reverse_complement_pam(const std::string &pam);

// ECMAScript regex matching exactly the bases the PAM allows.
std::string pam_to_regex(const std::string &pam);

// Scan every record on both strands for `target_length` bases adjacent to the
// PAM. Every offset is considered, so overlapping sites are all reported.
// Sites whose span contains 'N' are dropped. `target_length` must lie in
// [1, kMaxTargetLength]; anything else throws std::invalid_argument.
TargetMap extract_targets(const std::vector<SequenceRecord> &records,
                          const std::string &pam,
                          uint32_t target_length);

} // namespace sgrna_lib
