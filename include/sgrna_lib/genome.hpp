#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "sgrna_lib/types.hpp"

namespace sgrna_lib {

// Input that cannot be used safely (missing fields, nameless features).
class InputError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct RegionFileStats {
  size_t lines_read{0};
  size_t lines_skipped{0};
};

class Genome {
public:
  Genome() = default;

  static Genome load_fasta(const std::string &fasta_path);
  // Reads every record of every file, in order, into one genome. Regions come
  // from `gene` features, or from `CDS` features for records without genes.
  static Genome load_genbank(const std::vector<std::string> &genbank_paths);
  static Genome load_genbank(const std::string &genbank_path) {
    return load_genbank(std::vector<std::string>{genbank_path});
  }

  void write_fasta(const std::string &fasta_path) const;

  const std::vector<SequenceRecord> &records() const { return records_; }
  const std::vector<Region> &regions() const { return regions_; }
  std::map<std::string, uint64_t> chrom_lengths() const;

private:
  void add_record(SequenceRecord rec);

  std::vector<SequenceRecord> records_;
  std::vector<Region> regions_;
};

// Parses `gene<TAB>chrom<TAB>start<TAB>end<TAB>strand` lines. A line without
// five fields throws InputError; a line whose coordinates do not parse is
// skipped with a warning. Strand '.' or '?' yields one region per strand.
std::vector<Region> parse_region_file(const std::string &path, RegionFileStats *stats = nullptr);

// GenBank location string -> one or two regions (two when the strand is mixed).
std::vector<Region> regions_from_location(const std::string &gene,
                                          const std::string &chrom,
                                          const std::string &location);

} // namespace sgrna_lib
