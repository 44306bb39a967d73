#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sgrna_lib {

// A candidate guide site. `sequence` and `pam` read 5'->3' on the strand the
// site was found on; `start`/`end` are half-open forward-strand coordinates of
// `sequence` within `chrom`.
struct Target {
  std::string sequence;
  std::string pam;
  std::string chrom;
  uint64_t start{0};
  uint64_t end{0};
  bool reverse{false};
  // 0 until the scorer finds a unique alignment at some tolerance.
  int specificity{0};

  std::string key() const;
  std::string sequence_with_pam() const { return sequence + pam; }
};

// Inverse of Target::key(). Throws std::invalid_argument on malformed input.
// The returned target has specificity 0.
Target parse_target_key(const std::string &key);

// Keyed by Target::key(); inserting an equal key replaces the entry.
using TargetMap = std::map<std::string, Target>;

struct Region {
  std::string gene;
  std::string chrom;
  uint64_t start{0};
  uint64_t end{0};
  char strand{'+'};
};

struct AnnotatedTarget {
  Target target;
  bool annotated{false};
  std::string gene;
  int64_t offset{0};
  bool sense_strand{false};
};

struct SequenceRecord {
  std::string name;
  std::string bases;
};

char complement_base(char c);
std::string reverse_complement(const std::string &seq);

} // namespace sgrna_lib
