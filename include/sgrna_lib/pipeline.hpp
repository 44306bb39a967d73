#pragma once

#include <string>
#include <vector>
#include "sgrna_lib/aligner.hpp"
#include "sgrna_lib/annotator.hpp"
#include "sgrna_lib/config.hpp"
#include "sgrna_lib/genome.hpp"

namespace sgrna_lib {

struct PipelineOptions {
  std::vector<std::string> genbank_paths;
  std::string fasta_path;   // used when no GenBank input is given
  std::string regions_path; // overrides GenBank features when set
  std::string output_path;  // derived from the first input when empty
  std::string sam_copy;
  LibraryConfig config;
};

struct PipelineResult {
  std::string output_path;
  size_t targets{0};
  size_t rows{0};
  AnnotateStats annotate;
  RegionFileStats region_file;
};

// Output name used when none is given: "<first input minus extension>"
// + ".merged" for GenBank input, + ".targets.all.tsv".
std::string default_output_path(const PipelineOptions &options);

// Load, extract, score, annotate and write the report. `aligner` replaces the
// Bowtie aligner when non-null.
PipelineResult run_pipeline(const PipelineOptions &options, Aligner *aligner = nullptr);

} // namespace sgrna_lib
