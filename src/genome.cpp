#include "sgrna_lib/genome.hpp"
#include "sgrna_lib/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace sgrna_lib {

namespace {

struct LocPart {
  uint64_t start;
  uint64_t end;
  bool minus;
};

struct Feature {
  std::string key;
  std::string location;
  std::map<std::string, std::vector<std::string>> qualifiers;
};

std::string trim(const std::string &s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::string first_token(const std::string &s) {
  std::stringstream ss(s);
  std::string tok;
  ss >> tok;
  return tok;
}

bool parse_u64(const std::string &s, uint64_t &out) {
  if (s.empty() || !std::all_of(s.begin(), s.end(),
                                [](unsigned char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  try {
    out = std::stoull(s);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

uint64_t parse_position(const std::string &raw, const std::string &location) {
  std::string s;
  for (char c : raw) {
    if (c != '<' && c != '>' && !std::isspace(static_cast<unsigned char>(c))) s += c;
  }
  uint64_t v = 0;
  if (!parse_u64(s, v) || v == 0) throw InputError("Unparseable feature location: " + location);
  return v;
}

// Split on commas not nested inside parentheses.
std::vector<std::string> split_top_level(const std::string &s) {
  std::vector<std::string> parts;
  int depth = 0;
  std::string cur;
  for (char c : s) {
    if (c == '(') ++depth;
    if (c == ')') --depth;
    if (c == ',' && depth == 0) {
      parts.push_back(cur);
      cur.clear();
      continue;
    }
    cur += c;
  }
  parts.push_back(cur);
  return parts;
}

void parse_location(const std::string &raw, bool minus, const std::string &whole,
                    std::vector<LocPart> &out) {
  std::string loc = trim(raw);
  if (loc.empty()) throw InputError("Empty feature location: " + whole);
  for (const char *op : {"complement(", "join(", "order("}) {
    std::string prefix(op);
    if (!starts_with(loc, prefix)) continue;
    if (loc.back() != ')') throw InputError("Unbalanced feature location: " + whole);
    std::string inner = loc.substr(prefix.size(), loc.size() - prefix.size() - 1);
    if (prefix == "complement(") {
      parse_location(inner, !minus, whole, out);
    } else {
      for (const auto &part : split_top_level(inner)) parse_location(part, minus, whole, out);
    }
    return;
  }
  if (loc.find(':') != std::string::npos) {
    log_warn("Ignoring location part on another record: ", loc);
    return;
  }
  size_t dots = loc.find("..");
  if (dots != std::string::npos) {
    uint64_t a = parse_position(loc.substr(0, dots), whole);
    uint64_t b = parse_position(loc.substr(dots + 2), whole);
    if (b < a) throw InputError("Feature location ends before it starts: " + whole);
    out.push_back({a - 1, b, minus});
    return;
  }
  size_t caret = loc.find('^');
  if (caret != std::string::npos) {
    uint64_t a = parse_position(loc.substr(0, caret), whole);
    out.push_back({a, a, minus});
    return;
  }
  uint64_t a = parse_position(loc, whole);
  out.push_back({a - 1, a, minus});
}

// Collects features and sequence for one GenBank record at a time.
class GenbankRecordBuilder {
public:
  void reset() { *this = GenbankRecordBuilder(); }

  void header_line(const std::string &line) {
    if (starts_with(line, "LOCUS")) {
      reset();
      std::stringstream ss(line);
      std::string kw;
      ss >> kw >> locus_;
      active_ = true;
    } else if (starts_with(line, "ACCESSION")) {
      accession_ = first_token(line.substr(9));
    } else if (starts_with(line, "VERSION")) {
      version_ = first_token(line.substr(7));
    }
  }

  void feature_line(const std::string &line) {
    if (line.size() > 5 && line[5] != ' ') {
      Feature f;
      f.key = first_token(line);
      f.location = trim(line.substr(line.find(f.key) + f.key.size()));
      features_.push_back(std::move(f));
      in_location_ = true;
      open_qualifier_.clear();
      return;
    }
    if (features_.empty()) return;
    Feature &f = features_.back();
    std::string content = trim(line);
    if (content.empty()) return;
    if (!open_qualifier_.empty()) {
      std::string &value = f.qualifiers[open_qualifier_].back();
      value += ' ';
      value += content;
      if (content.back() == '"') {
        value = value.substr(1, value.size() - 2);
        open_qualifier_.clear();
      }
      return;
    }
    if (content[0] == '/') {
      in_location_ = false;
      size_t eq = content.find('=');
      std::string name = content.substr(1, eq == std::string::npos ? std::string::npos : eq - 1);
      std::string value = eq == std::string::npos ? "" : content.substr(eq + 1);
      if (!value.empty() && value[0] == '"') {
        if (value.size() >= 2 && value.back() == '"') {
          value = value.substr(1, value.size() - 2);
        } else {
          open_qualifier_ = name;
        }
      }
      f.qualifiers[name].push_back(value);
      return;
    }
    if (in_location_) f.location += content;
  }

  void sequence_line(const std::string &line) {
    for (char c : line) {
      if (std::isalpha(static_cast<unsigned char>(c))) bases_ += c;
    }
  }

  bool active() const { return active_; }

  std::string name() const {
    if (!version_.empty()) return version_;
    if (!accession_.empty()) return accession_;
    return locus_;
  }

  SequenceRecord take_record() {
    SequenceRecord rec;
    rec.name = name();
    rec.bases = std::move(bases_);
    return rec;
  }

  std::vector<Region> regions(const std::string &chrom) const {
    std::vector<Region> out;
    for (const char *ftype : {"gene", "CDS"}) {
      for (const auto &f : features_) {
        if (f.key != ftype) continue;
        std::string gene;
        auto lt = f.qualifiers.find("locus_tag");
        auto gn = f.qualifiers.find("gene");
        if (lt != f.qualifiers.end() && !lt->second.empty()) {
          gene = lt->second.front();
        } else if (gn != f.qualifiers.end() && !gn->second.empty()) {
          gene = gn->second.front();
        } else {
          throw InputError("No locus_tag or gene for " + f.key + " feature at " + f.location +
                           " on " + chrom);
        }
        auto r = regions_from_location(gene, chrom, f.location);
        out.insert(out.end(), r.begin(), r.end());
      }
      if (!out.empty()) break;
    }
    return out;
  }

private:
  bool active_{false};
  bool in_location_{false};
  std::string open_qualifier_;
  std::string locus_;
  std::string accession_;
  std::string version_;
  std::string bases_;
  std::vector<Feature> features_;
};

} // namespace

std::vector<Region> regions_from_location(const std::string &gene,
                                          const std::string &chrom,
                                          const std::string &location) {
  std::vector<LocPart> parts;
  parse_location(location, false, location, parts);
  if (parts.empty()) return {};
  uint64_t start = parts.front().start;
  uint64_t end = parts.front().end;
  size_t minus = 0;
  for (const auto &p : parts) {
    start = std::min(start, p.start);
    end = std::max(end, p.end);
    if (p.minus) ++minus;
  }
  Region r{gene, chrom, start, end, '+'};
  if (minus == parts.size()) {
    r.strand = '-';
    return {r};
  }
  if (minus == 0) return {r};
  // Mixed strands: claim targets from either orientation.
  Region rev = r;
  rev.strand = '-';
  return {r, rev};
}

void Genome::add_record(SequenceRecord rec) {
  for (const auto &existing : records_) {
    if (existing.name == rec.name) throw InputError("Duplicate sequence name: " + rec.name);
  }
  records_.push_back(std::move(rec));
}

std::map<std::string, uint64_t> Genome::chrom_lengths() const {
  std::map<std::string, uint64_t> lens;
  for (const auto &r : records_) lens[r.name] = r.bases.size();
  return lens;
}

Genome Genome::load_fasta(const std::string &fasta_path) {
  std::ifstream in(fasta_path);
  if (!in) throw InputError("Failed to open FASTA: " + fasta_path);
  Genome g;
  SequenceRecord cur;
  bool have = false;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    if (line[0] == '>') {
      if (have) g.add_record(std::move(cur));
      cur = SequenceRecord{};
      cur.name = first_token(line.substr(1));
      if (cur.name.empty()) throw InputError("FASTA header without a name in " + fasta_path);
      have = true;
      continue;
    }
    if (!have) throw InputError("Sequence data before first header in " + fasta_path);
    for (char c : line) {
      if (!std::isspace(static_cast<unsigned char>(c))) cur.bases += c;
    }
  }
  if (have) g.add_record(std::move(cur));
  log_info("Read ", g.records_.size(), " sequences from ", fasta_path, ".");
  return g;
}

Genome Genome::load_genbank(const std::vector<std::string> &genbank_paths) {
  Genome g;
  for (const auto &path : genbank_paths) {
    std::ifstream in(path);
    if (!in) throw InputError("Failed to open GenBank file: " + path);
    enum class Section { Header, Features, Origin } section = Section::Header;
    GenbankRecordBuilder rec;
    std::string line;
    size_t regions_before = g.regions_.size();
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (starts_with(line, "//")) {
        if (rec.active()) {
          std::string name = rec.name();
          auto regions = rec.regions(name);
          g.add_record(rec.take_record());
          g.regions_.insert(g.regions_.end(), regions.begin(), regions.end());
        }
        rec.reset();
        section = Section::Header;
        continue;
      }
      if (!line.empty() && line[0] != ' ') {
        if (starts_with(line, "FEATURES")) {
          section = Section::Features;
        } else if (starts_with(line, "ORIGIN")) {
          section = Section::Origin;
        } else {
          section = Section::Header;
          rec.header_line(line);
        }
        continue;
      }
      if (!rec.active()) continue;
      if (section == Section::Features) rec.feature_line(line);
      else if (section == Section::Origin) rec.sequence_line(line);
    }
    if (rec.active()) throw InputError("Truncated GenBank record (missing //) in " + path);
    log_info("Found ", g.regions_.size() - regions_before, " target regions in ", path, ".");
  }
  if (g.records_.empty()) throw InputError("No GenBank records found");
  return g;
}

void Genome::write_fasta(const std::string &fasta_path) const {
  std::ostringstream text;
  for (const auto &r : records_) {
    text << '>' << r.name << '\n';
    for (size_t i = 0; i < r.bases.size(); i += 60) text << r.bases.substr(i, 60) << '\n';
  }
  const std::string rendered = text.str();

  // Leave an identical file untouched so indexes built from it stay current.
  {
    std::ifstream existing(fasta_path, std::ios::binary);
    if (existing) {
      std::ostringstream current;
      current << existing.rdbuf();
      if (current.str() == rendered) {
        log_debug("FASTA ", fasta_path, " is unchanged.");
        return;
      }
    }
  }

  std::ofstream out(fasta_path);
  if (!out) throw std::runtime_error("Failed to open FASTA for write: " + fasta_path);
  out << rendered;
  out.flush();
  if (!out) throw std::runtime_error("Failed to write FASTA: " + fasta_path);
}

std::vector<Region> parse_region_file(const std::string &path, RegionFileStats *stats) {
  log_info("Parsing target region file ", path, ".");
  std::ifstream in(path);
  if (!in) throw InputError("Failed to open region file: " + path);
  RegionFileStats local;
  RegionFileStats &st = stats ? *stats : local;
  st = RegionFileStats{};
  std::vector<Region> regions;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') continue;
    std::string x = trim(line);
    if (x.empty()) continue;
    ++st.lines_read;
    std::vector<std::string> parts;
    std::stringstream ss(x);
    std::string field;
    while (std::getline(ss, field, '\t')) parts.push_back(field);
    if (parts.size() != 5) throw InputError("Could not parse from " + path + ": " + x);
    Region r;
    r.gene = parts[0];
    r.chrom = parts[1];
    if (!parse_u64(parts[2], r.start) || !parse_u64(parts[3], r.end)) {
      log_warn("Could not fully parse: ", x);
      ++st.lines_skipped;
      continue;
    }
    const std::string &strand = parts[4];
    if (strand == "+" || strand == "-") {
      r.strand = strand[0];
      regions.push_back(r);
    } else if (strand == "." || strand == "?") {
      r.strand = '+';
      regions.push_back(r);
      r.strand = '-';
      regions.push_back(r);
    } else {
      throw InputError("Unknown strand '" + strand + "' in " + path + ": " + x);
    }
  }
  log_info("Found ", regions.size(), " target regions in region file.");
  return regions;
}

} // namespace sgrna_lib
