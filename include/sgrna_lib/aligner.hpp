#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace sgrna_lib {

struct ReadRecord {
  std::string name;
  std::string sequence;
  std::string quality;
};

struct AlignParams {
  int seed_mismatches{3};
  int seed_length{15};
  int max_dissimilarity{70};
  // Reads with more reported alignments than this are discarded.
  int max_alignments{1};
  bool best{true};
  bool try_hard{true};
};

// Raised when the external aligner exits with a non-zero status.
class AlignerError : public std::runtime_error {
public:
  AlignerError(const std::string &msg, int exit_code)
      : std::runtime_error(msg), exit_code_(exit_code) {}
  int exit_code() const { return exit_code_; }

private:
  int exit_code_;
};

// Synchronous request/response boundary to a short-read aligner. align()
// blocks until the tool finishes and returns the names of reads that aligned
// within the parameters.
class Aligner {
public:
  virtual ~Aligner() = default;
  virtual void ensure_index() = 0;
  virtual std::vector<std::string> align(const std::vector<ReadRecord> &reads,
                                         const AlignParams &params) = 0;
};

struct BowtieOptions {
  std::string genome_fasta;
  std::string index_prefix; // defaults to genome_fasta
  std::string bowtie{"bowtie"};
  std::string bowtie_build{"bowtie-build"};
  int threads{6};
  int chunk_mbs{256};
  std::string sam_copy; // if set, the SAM of the latest round is copied here
};

class BowtieAligner : public Aligner {
public:
  explicit BowtieAligner(BowtieOptions opts);

  void ensure_index() override;
  std::vector<std::string> align(const std::vector<ReadRecord> &reads,
                                 const AlignParams &params) override;

  const std::string &index_prefix() const { return opts_.index_prefix; }

  std::vector<std::string> bowtie_command(const AlignParams &params,
                                          const std::string &fastq_path,
                                          const std::string &sam_path) const;
  std::vector<std::string> build_command() const;

private:
  BowtieOptions opts_;
};

// Names of every mapped record in a SAM/BAM file.
std::vector<std::string> read_aligned_names(const std::string &sam_path);

// Write reads as FASTQ. Throws if the file cannot be written.
void write_fastq(const std::string &path, const std::vector<ReadRecord> &reads);

// Runs argv through the shell with each argument quoted; returns the exit
// status of the command, or -1 if it did not exit normally.
int run_command(const std::vector<std::string> &argv);

} // namespace sgrna_lib
