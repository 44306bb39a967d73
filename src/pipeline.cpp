#include "sgrna_lib/pipeline.hpp"
#include "sgrna_lib/log.hpp"
#include "sgrna_lib/report.hpp"
#include "sgrna_lib/specificity.hpp"
#include "sgrna_lib/targets.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace sgrna_lib {

namespace {

// "dir/genome.gb" -> {"dir/genome", ".gb"}
std::pair<std::string, std::string> split_ext(const std::string &path) {
  size_t slash = path.find_last_of('/');
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
      dot == (slash == std::string::npos ? 0 : slash + 1)) {
    return {path, ""};
  }
  return {path.substr(0, dot), path.substr(dot)};
}

std::string merged_genbank_name(const std::string &first) {
  auto parts = split_ext(first);
  return parts.first + ".merged" + parts.second;
}

} // namespace

std::string default_output_path(const PipelineOptions &options) {
  if (!options.genbank_paths.empty()) {
    return split_ext(merged_genbank_name(options.genbank_paths.front())).first + ".targets.all.tsv";
  }
  return split_ext(options.fasta_path).first + ".targets.all.tsv";
}

PipelineResult run_pipeline(const PipelineOptions &options, Aligner *aligner) {
  ScopedTimer t_total("pipeline.total", timing_enabled());
  const LibraryConfig &cfg = options.config;
  PipelineResult result;
  result.output_path = options.output_path.empty() ? default_output_path(options) : options.output_path;

  Genome genome;
  std::string fasta_path;
  if (!options.genbank_paths.empty()) {
    ScopedTimer t("pipeline.load_genbank", timing_enabled());
    genome = Genome::load_genbank(options.genbank_paths);
    fasta_path = merged_genbank_name(options.genbank_paths.front()) + ".fasta";
    genome.write_fasta(fasta_path);
  } else if (!options.fasta_path.empty()) {
    if (options.regions_path.empty()) {
      throw std::invalid_argument("a region file is required with FASTA input");
    }
    ScopedTimer t("pipeline.load_fasta", timing_enabled());
    genome = Genome::load_fasta(options.fasta_path);
    fasta_path = options.fasta_path;
  } else {
    throw std::invalid_argument("no genome input given");
  }

  TargetMap targets = extract_targets(genome.records(), cfg.pam, cfg.target_length);
  result.targets = targets.size();

  std::unique_ptr<BowtieAligner> bowtie;
  if (!aligner) {
    BowtieOptions bo;
    bo.genome_fasta = fasta_path;
    bo.bowtie = cfg.bowtie;
    bo.bowtie_build = cfg.bowtie_build;
    bo.threads = cfg.threads;
    bo.chunk_mbs = cfg.chunk_mbs;
    bo.sam_copy = options.sam_copy;
    bowtie = std::make_unique<BowtieAligner>(bo);
    aligner = bowtie.get();
  }
  ScorerParams sp;
  sp.tolerances = cfg.tolerances;
  sp.seed_mismatches = cfg.seed_mismatches;
  sp.seed_length = cfg.seed_length;
  sp.quality = cfg.quality;
  SpecificityScorer scorer(*aligner, sp);
  scorer.score(targets);

  // Scoring is finished; annotation only sees the settled targets.
  const TargetMap scored = std::move(targets);

  std::vector<Region> regions;
  if (!options.regions_path.empty()) {
    regions = parse_region_file(options.regions_path, &result.region_file);
  } else {
    regions = genome.regions();
  }
  sort_regions(regions);

  std::vector<AnnotatedTarget> rows = annotate_targets(scored, regions, genome.chrom_lengths(),
                                                       cfg.allow_partial_overlap, &result.annotate);
  result.rows = rows.size();

  log_info("Writing ", rows.size(), " annotated targets to ", result.output_path);
  {
    ScopedTimer t("pipeline.write_report", timing_enabled());
    write_report_file(result.output_path, rows);
  }
  return result;
}

} // namespace sgrna_lib
