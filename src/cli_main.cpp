#include "sgrna_lib/config.hpp"
#include "sgrna_lib/genome.hpp"
#include "sgrna_lib/log.hpp"
#include "sgrna_lib/pipeline.hpp"
#include "sgrna_lib/report.hpp"
#include "sgrna_lib/targets.hpp"
#include "sgrna_lib/version.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sgrna_lib;

struct CLIOptionsExtract {
  std::vector<std::string> genbank;
  std::string fasta;
  std::string config_path;
  std::string pam;
  int target_len{-1};
  std::string out;
};

static void print_usage() {
  std::cerr << "sgrna-library " << SGRNA_LIB_VERSION << "\n";
  std::cerr << "Usage:\n";
  std::cerr << "  sgrna-library build --genbank genome.gb [--genbank plasmid.gb] [--output targets.tsv]\n";
  std::cerr << "  sgrna-library build --fasta genome.fa --regions regions.tsv [--output targets.tsv]\n";
  std::cerr << "      [--regions regions.tsv]  # gene<TAB>chrom<TAB>start<TAB>end<TAB>strand, overrides GenBank features\n";
  std::cerr << "      [--config config.json] [--pam NGG] [--target-length 20] [--tolerances 39,30,20,11,1]\n";
  std::cerr << "      [--only-fully-overlapping] [--sam-copy last_round.sam] [--threads 6]\n";
  std::cerr << "  sgrna-library extract --genbank genome.gb | --fasta genome.fa [--pam NGG] [--target-length 20] [--output targets.tsv]\n";
  std::cerr << "  sgrna-library --version\n";
}

static int parse_int(const std::string &flag, const std::string &value) {
  size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(value, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects an integer, got " + value);
  }
  if (used != value.size()) throw std::runtime_error(flag + " expects an integer, got " + value);
  return v;
}

static uint32_t parse_target_length(const std::string &value) {
  int v = parse_int("--target-length", value);
  if (v <= 0 || static_cast<uint32_t>(v) > kMaxTargetLength) {
    throw std::runtime_error("--target-length must be in [1, " + std::to_string(kMaxTargetLength) + "]");
  }
  return static_cast<uint32_t>(v);
}

static int run_build(int argc, char **argv) {
  PipelineOptions opt;
  std::string config_path;
  std::string pam;
  std::string tolerances;
  int target_len = -1;
  int threads = -1;
  bool only_full = false;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--genbank" && i + 1 < argc) { opt.genbank_paths.push_back(argv[++i]); continue; }
    if (arg == "--fasta" && i + 1 < argc) { opt.fasta_path = argv[++i]; continue; }
    if (arg == "--regions" && i + 1 < argc) { opt.regions_path = argv[++i]; continue; }
    if (arg == "--output" && i + 1 < argc) { opt.output_path = argv[++i]; continue; }
    if (arg == "--sam-copy" && i + 1 < argc) { opt.sam_copy = argv[++i]; continue; }
    if (arg == "--config" && i + 1 < argc) { config_path = argv[++i]; continue; }
    if (arg == "--pam" && i + 1 < argc) { pam = argv[++i]; continue; }
    if (arg == "--target-length" && i + 1 < argc) { target_len = static_cast<int>(parse_target_length(argv[++i])); continue; }
    if (arg == "--tolerances" && i + 1 < argc) { tolerances = argv[++i]; continue; }
    if (arg == "--threads" && i + 1 < argc) { threads = parse_int("--threads", argv[++i]); continue; }
    if (arg == "--only-fully-overlapping") { only_full = true; continue; }
    throw std::runtime_error("Unknown or incomplete option: " + arg);
  }
  if (opt.genbank_paths.empty() && opt.fasta_path.empty()) {
    throw std::runtime_error("--genbank or --fasta is required");
  }
  if (!opt.genbank_paths.empty() && !opt.fasta_path.empty()) {
    throw std::runtime_error("--genbank and --fasta are mutually exclusive");
  }
  if (!opt.fasta_path.empty() && opt.regions_path.empty()) {
    throw std::runtime_error("--regions is required with --fasta");
  }

  if (!config_path.empty()) load_config(config_path, opt.config);
  if (!pam.empty()) opt.config.pam = pam;
  if (target_len > 0) opt.config.target_length = static_cast<uint32_t>(target_len);
  if (!tolerances.empty()) opt.config.tolerances = parse_tolerance_list(tolerances);
  if (threads > 0) opt.config.threads = threads;
  if (only_full) opt.config.allow_partial_overlap = false;

  PipelineResult res = run_pipeline(opt);
  std::cerr << "Report written to " << res.output_path << " with " << res.rows << " rows from "
            << res.targets << " targets\n";
  if (res.region_file.lines_skipped > 0) {
    std::cerr << "Skipped " << res.region_file.lines_skipped << " unparseable region lines\n";
  }
  if (res.annotate.regions_missing_chrom > 0 || res.annotate.regions_out_of_bounds > 0) {
    std::cerr << "Skipped " << res.annotate.regions_missing_chrom << " regions on unknown sequences and "
              << res.annotate.regions_out_of_bounds << " regions past the sequence end\n";
  }
  if (res.annotate.regions_without_targets > 0) {
    std::cerr << res.annotate.regions_without_targets << " regions had no overlapping targets\n";
  }
  return 0;
}

static int run_extract(int argc, char **argv) {
  CLIOptionsExtract opt;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--genbank" && i + 1 < argc) { opt.genbank.push_back(argv[++i]); continue; }
    if (arg == "--fasta" && i + 1 < argc) { opt.fasta = argv[++i]; continue; }
    if (arg == "--config" && i + 1 < argc) { opt.config_path = argv[++i]; continue; }
    if (arg == "--pam" && i + 1 < argc) { opt.pam = argv[++i]; continue; }
    if (arg == "--target-length" && i + 1 < argc) { opt.target_len = static_cast<int>(parse_target_length(argv[++i])); continue; }
    if (arg == "--output" && i + 1 < argc) { opt.out = argv[++i]; continue; }
    throw std::runtime_error("Unknown or incomplete option: " + arg);
  }
  if (opt.genbank.empty() == opt.fasta.empty()) {
    throw std::runtime_error("exactly one of --genbank or --fasta is required");
  }
  LibraryConfig cfg;
  if (!opt.config_path.empty()) load_config(opt.config_path, cfg);
  if (!opt.pam.empty()) cfg.pam = opt.pam;
  if (opt.target_len > 0) cfg.target_length = static_cast<uint32_t>(opt.target_len);

  Genome genome = opt.fasta.empty() ? Genome::load_genbank(opt.genbank) : Genome::load_fasta(opt.fasta);
  TargetMap targets = extract_targets(genome.records(), cfg.pam, cfg.target_length);
  std::vector<AnnotatedTarget> rows;
  rows.reserve(targets.size());
  for (const auto &kv : targets) {
    AnnotatedTarget a;
    a.target = kv.second;
    rows.push_back(a);
  }
  if (opt.out.empty()) {
    write_report(std::cout, rows);
  } else {
    write_report_file(opt.out, rows);
    std::cerr << "Wrote " << rows.size() << " targets to " << opt.out << "\n";
  }
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string sub = argv[1];
  try {
    if (sub == "--version" || sub == "-V") {
      std::cout << SGRNA_LIB_VERSION << "\n";
      return 0;
    }
    if (sub == "build") {
      ScopedTimer t_total("cli.build.total", timing_enabled());
      return run_build(argc, argv);
    } else if (sub == "extract") {
      ScopedTimer t_total("cli.extract.total", timing_enabled());
      return run_extract(argc, argv);
    } else {
      print_usage();
      return 1;
    }
  } catch (const AlignerError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return e.exit_code() != 0 ? e.exit_code() : 1;
  } catch (const InputError &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
