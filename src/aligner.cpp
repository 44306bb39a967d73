#include "sgrna_lib/aligner.hpp"
#include "sgrna_lib/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>

#include <htslib/sam.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sgrna_lib {

namespace {

std::string shell_escape(const std::string &arg) {
  std::string escaped = "'";
  for (char c : arg) {
    if (c == '\'') {
      escaped += "'\\''";
    } else {
      escaped += c;
    }
  }
  escaped += "'";
  return escaped;
}

bool file_exists(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

// True when `path` exists and was modified before `reference`. A missing
// `reference` never makes `path` stale.
bool older_than(const std::string &path, const std::string &reference) {
  struct stat a;
  struct stat b;
  if (::stat(path.c_str(), &a) != 0 || ::stat(reference.c_str(), &b) != 0) return false;
  if (a.st_mtim.tv_sec != b.st_mtim.tv_sec) return a.st_mtim.tv_sec < b.st_mtim.tv_sec;
  return a.st_mtim.tv_nsec < b.st_mtim.tv_nsec;
}

// mkstemp-backed file, unlinked when the owner goes out of scope.
class TempFile {
public:
  explicit TempFile(const char *tag) {
    const char *dir = std::getenv("TMPDIR");
    std::string tmpl = std::string(dir && dir[0] ? dir : "/tmp") + "/sgrna_" + tag + "_XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemp(buf.data());
    if (fd < 0) throw std::runtime_error("Failed to create temporary file " + tmpl);
    ::close(fd);
    path_ = buf.data();
  }
  ~TempFile() { ::unlink(path_.c_str()); }
  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

void copy_file(const std::string &from, const std::string &to) {
  std::ifstream in(from, std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open " + from);
  std::ofstream out(to, std::ios::binary);
  if (!out) throw std::runtime_error("Failed to open " + to + " for writing");
  out << in.rdbuf();
  if (!out) throw std::runtime_error("Failed to write " + to);
}

std::string join_command(const std::vector<std::string> &argv) {
  std::string cmd;
  for (const auto &a : argv) {
    if (!cmd.empty()) cmd += ' ';
    cmd += a;
  }
  return cmd;
}

struct SamCloser {
  void operator()(samFile *f) const { if (f) sam_close(f); }
};
struct HeaderFree {
  void operator()(sam_hdr_t *h) const { if (h) sam_hdr_destroy(h); }
};
struct RecordFree {
  void operator()(bam1_t *b) const { if (b) bam_destroy1(b); }
};

} // namespace

int run_command(const std::vector<std::string> &argv) {
  if (argv.empty()) throw std::invalid_argument("empty command");
  std::string cmd;
  for (const auto &a : argv) {
    if (!cmd.empty()) cmd += ' ';
    cmd += shell_escape(a);
  }
  int rc = std::system(cmd.c_str());
  if (rc == -1) return -1;
  if (!WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

void write_fastq(const std::string &path, const std::vector<ReadRecord> &reads) {
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to open FASTQ for write: " + path);
  for (const auto &r : reads) {
    out << '@' << r.name << '\n' << r.sequence << "\n+\n" << r.quality << '\n';
  }
  out.flush();
  if (!out) throw std::runtime_error("Failed to write FASTQ: " + path);
}

std::vector<std::string> read_aligned_names(const std::string &sam_path) {
  std::unique_ptr<samFile, SamCloser> fp(sam_open(sam_path.c_str(), "r"));
  if (!fp) throw std::runtime_error("Failed to open alignments: " + sam_path);
  std::unique_ptr<sam_hdr_t, HeaderFree> hdr(sam_hdr_read(fp.get()));
  if (!hdr) throw std::runtime_error("Failed to read alignment header: " + sam_path);
  std::unique_ptr<bam1_t, RecordFree> rec(bam_init1());
  if (!rec) throw std::runtime_error("Out of memory reading " + sam_path);

  std::vector<std::string> names;
  int r = 0;
  while ((r = sam_read1(fp.get(), hdr.get(), rec.get())) >= 0) {
    // flag 4: unmapped
    if (rec->core.flag & BAM_FUNMAP) continue;
    names.emplace_back(bam_get_qname(rec.get()));
  }
  if (r < -1) throw std::runtime_error("Truncated or corrupt alignments: " + sam_path);
  return names;
}

BowtieAligner::BowtieAligner(BowtieOptions opts) : opts_(std::move(opts)) {
  if (opts_.genome_fasta.empty()) {
    throw std::invalid_argument("Bowtie aligner needs a genome FASTA");
  }
  if (opts_.index_prefix.empty()) opts_.index_prefix = opts_.genome_fasta;
  if (opts_.threads < 1) opts_.threads = 1;
}

std::vector<std::string> BowtieAligner::build_command() const {
  return {opts_.bowtie_build, opts_.genome_fasta, opts_.index_prefix};
}

std::vector<std::string> BowtieAligner::bowtie_command(const AlignParams &params,
                                                       const std::string &fastq_path,
                                                       const std::string &sam_path) const {
  std::vector<std::string> cmd{opts_.bowtie};
  cmd.push_back("-S");          // SAM output
  cmd.push_back("--nomaqround");
  cmd.push_back("-q");          // FASTQ input
  cmd.push_back("-a");          // report every hit so -m can judge uniqueness
  if (params.best) cmd.push_back("--best");
  if (params.try_hard) cmd.push_back("--tryhard");
  cmd.push_back("--chunkmbs");
  cmd.push_back(std::to_string(opts_.chunk_mbs));
  cmd.push_back("-p");
  cmd.push_back(std::to_string(opts_.threads));
  cmd.push_back("-n");
  cmd.push_back(std::to_string(params.seed_mismatches));
  cmd.push_back("-l");
  cmd.push_back(std::to_string(params.seed_length));
  cmd.push_back("-e");
  cmd.push_back(std::to_string(params.max_dissimilarity));
  cmd.push_back("-m");
  cmd.push_back(std::to_string(params.max_alignments));
  cmd.push_back(opts_.index_prefix);
  cmd.push_back(fastq_path);
  cmd.push_back(sam_path);
  return cmd;
}

void BowtieAligner::ensure_index() {
  const std::string first_part = opts_.index_prefix + ".1.ebwt";
  if (file_exists(first_part)) {
    if (!older_than(first_part, opts_.genome_fasta)) {
      log_debug("Bowtie index ", opts_.index_prefix, " already present.");
      return;
    }
    log_info("Bowtie index ", opts_.index_prefix, " predates ", opts_.genome_fasta, "; rebuilding.");
  }
  ScopedTimer timer("bowtie.build_index", timing_enabled());
  auto cmd = build_command();
  log_info("Building bowtie index: ", join_command(cmd));
  int rc = run_command(cmd);
  if (rc != 0) {
    throw AlignerError("Failed to build bowtie index " + opts_.index_prefix, rc == -1 ? 1 : rc);
  }
}

std::vector<std::string> BowtieAligner::align(const std::vector<ReadRecord> &reads,
                                              const AlignParams &params) {
  TempFile fastq("reads");
  TempFile sam("hits");
  write_fastq(fastq.path(), reads);

  auto cmd = bowtie_command(params, fastq.path(), sam.path());
  log_info(join_command(cmd));
  int rc = run_command(cmd);
  if (rc != 0) {
    std::ostringstream msg;
    msg << "bowtie failed with status " << rc << " at tolerance " << params.max_dissimilarity;
    throw AlignerError(msg.str(), rc == -1 ? 1 : rc);
  }
  if (!opts_.sam_copy.empty()) copy_file(sam.path(), opts_.sam_copy);
  return read_aligned_names(sam.path());
}

} // namespace sgrna_lib
