#include "sgrna_lib/targets.hpp"
#include "sgrna_lib/log.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace sgrna_lib {

namespace {

const std::string kBases = "ACGT";

char iupac_complement(char c) {
  switch (c) {
    case 'A': return 'T';
    case 'C': return 'G';
    case 'G': return 'C';
    case 'T': return 'A';
    case 'R': return 'Y';
    case 'Y': return 'R';
    case 'K': return 'M';
    case 'M': return 'K';
    case 'B': return 'V';
    case 'V': return 'B';
    case 'D': return 'H';
    case 'H': return 'D';
    case 'S': case 'W': case 'N': case '.': return c;
    default:
      throw std::invalid_argument(std::string("Unknown PAM symbol: ") + c);
  }
}

const char *iupac_class(char c) {
  switch (c) {
    case 'A': return "A";
    case 'C': return "C";
    case 'G': return "G";
    case 'T': return "T";
    case 'R': return "[AG]";
    case 'Y': return "[CT]";
    case 'S': return "[CG]";
    case 'W': return "[AT]";
    case 'K': return "[GT]";
    case 'M': return "[AC]";
    case 'B': return "[CGT]";
    case 'D': return "[AGT]";
    case 'H': return "[ACT]";
    case 'V': return "[ACG]";
    case 'N': case '.': return ".";
    default:
      throw std::invalid_argument(std::string("Unknown PAM symbol: ") + c);
  }
}

std::string upper(const std::string &s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string symbol_complement(const std::string &sym) {
  if (sym.size() == 1) return std::string(1, iupac_complement(sym[0]));
  std::string out = "[";
  for (size_t i = 1; i + 1 < sym.size(); ++i) out += complement_base(sym[i]);
  out += ']';
  return out;
}

void scan_strand(const std::string &chrom, const std::string &genome, const std::regex &re,
                 bool reverse, size_t pam_len, uint32_t target_length, TargetMap &out) {
  auto begin = std::sregex_iterator(genome.begin(), genome.end(), re);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    const std::smatch &hit = *it;
    std::string span = hit.str(1);
    if (span.find('N') != std::string::npos) continue;
    uint64_t pos = static_cast<uint64_t>(hit.position(0));
    Target t;
    t.chrom = chrom;
    t.reverse = reverse;
    if (!reverse) {
      t.sequence = hit.str(2);
      t.pam = span.substr(span.size() - pam_len);
      t.start = pos;
    } else {
      std::string rc = reverse_complement(span);
      t.sequence = reverse_complement(hit.str(2));
      t.pam = rc.substr(rc.size() - pam_len);
      t.start = pos + pam_len;
    }
    t.end = t.start + target_length;
    out[t.key()] = t;
  }
}

} // namespace

std::vector<std::string> parse_pam(const std::string &pam) {
  std::string p = upper(pam);
  std::vector<std::string> symbols;
  for (size_t i = 0; i < p.size(); ++i) {
    if (p[i] == '[') {
      size_t close = p.find(']', i);
      if (close == std::string::npos) {
        throw std::invalid_argument("Unterminated class in PAM: " + pam);
      }
      std::string cls = p.substr(i, close - i + 1);
      if (cls.size() < 3) throw std::invalid_argument("Empty class in PAM: " + pam);
      for (size_t j = 1; j + 1 < cls.size(); ++j) {
        if (kBases.find(cls[j]) == std::string::npos) {
          throw std::invalid_argument("PAM classes may only hold A/C/G/T: " + pam);
        }
      }
      symbols.push_back(cls);
      i = close;
      continue;
    }
    iupac_class(p[i]); // validates
    symbols.push_back(std::string(1, p[i]));
  }
  if (symbols.empty()) throw std::invalid_argument("PAM pattern is empty");
  return symbols;
}

size_t pam_length(const std::string &pam) { return parse_pam(pam).size(); }

std::string reverse_complement_pam(const std::string &pam) {
  auto symbols = parse_pam(pam);
  std::string out;
  for (auto it = symbols.rbegin(); it != symbols.rend(); ++it) out += symbol_complement(*it);
  return out;
}

std::string pam_to_regex(const std::string &pam) {
  std::string re;
  for (const auto &sym : parse_pam(pam)) {
    re += sym.size() == 1 ? std::string(iupac_class(sym[0])) : sym;
  }
  return re;
}

TargetMap extract_targets(const std::vector<SequenceRecord> &records,
                          const std::string &pam,
                          uint32_t target_length) {
  if (target_length == 0) throw std::invalid_argument("target length must be positive");
  if (target_length > kMaxTargetLength) {
    throw std::invalid_argument("target length " + std::to_string(target_length) +
                                " exceeds " + std::to_string(kMaxTargetLength));
  }
  ScopedTimer timer("extract_targets", timing_enabled());
  const size_t pam_len = pam_length(pam);
  const std::string block = "(.{" + std::to_string(target_length) + "})";
  const std::regex forward("(?=(" + block + pam_to_regex(pam) + "))");
  const std::regex backward("(?=(" + pam_to_regex(reverse_complement_pam(pam)) + block + "))");

  TargetMap targets;
  for (const auto &rec : records) {
    log_debug("Scanning ", rec.name, " (", rec.bases.size(), " bases)");
    std::string genome = upper(rec.bases);
    scan_strand(rec.name, genome, forward, false, pam_len, target_length, targets);
    scan_strand(rec.name, genome, backward, true, pam_len, target_length, targets);
  }
  log_info(targets.size(), " raw targets.");
  return targets;
}

} // namespace sgrna_lib
