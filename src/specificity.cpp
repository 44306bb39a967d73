#include "sgrna_lib/specificity.hpp"
#include "sgrna_lib/log.hpp"

#include <stdexcept>
#include <utility>

namespace sgrna_lib {

std::string fit_quality(const std::string &quality, size_t length) {
  if (quality.size() >= length) return quality.substr(0, length);
  return quality + std::string(length - quality.size(), '+');
}

SpecificityScorer::SpecificityScorer(Aligner &aligner, ScorerParams params)
    : aligner_(aligner), params_(std::move(params)) {
  if (params_.tolerances.empty()) {
    throw std::invalid_argument("tolerance schedule cannot be empty");
  }
  for (int t : params_.tolerances) {
    if (t <= 0) throw std::invalid_argument("tolerances must be positive, got " + std::to_string(t));
  }
  if (params_.seed_length <= 0 || params_.seed_mismatches < 0 || params_.seed_mismatches > 3) {
    throw std::invalid_argument("seed length must be positive and seed mismatches within 0..3");
  }
}

std::vector<ReadRecord> SpecificityScorer::build_batch(const TargetMap &targets) const {
  std::vector<ReadRecord> reads;
  for (const auto &kv : targets) {
    const Target &t = kv.second;
    if (t.specificity > 0) continue;
    ReadRecord r;
    r.name = kv.first;
    r.sequence = reverse_complement(t.sequence_with_pam());
    r.quality = fit_quality(params_.quality, r.sequence.size());
    reads.push_back(std::move(r));
  }
  return reads;
}

void SpecificityScorer::score(TargetMap &targets) const {
  ScopedTimer timer("score_specificity", timing_enabled());
  aligner_.ensure_index();
  for (int tolerance : params_.tolerances) {
    std::vector<ReadRecord> batch = build_batch(targets);
    if (batch.empty()) {
      log_info("Every target scored; skipping remaining tolerances.");
      break;
    }
    log_info("Marking specificity threshold ", tolerance, " for ", batch.size(), " targets.");

    AlignParams ap;
    ap.seed_mismatches = params_.seed_mismatches;
    ap.seed_length = params_.seed_length;
    ap.max_dissimilarity = tolerance;
    ap.max_alignments = 1;
    ap.best = true;
    ap.try_hard = true;

    size_t marked = 0;
    for (const auto &name : aligner_.align(batch, ap)) {
      auto it = targets.find(name);
      if (it == targets.end()) {
        throw std::runtime_error("Aligner returned unknown read: " + name);
      }
      if (it->second.specificity < tolerance) {
        it->second.specificity = tolerance;
        ++marked;
      }
    }
    log_info(marked, " targets unique at threshold ", tolerance, ".");
  }
}

} // namespace sgrna_lib
