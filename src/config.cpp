#include "sgrna_lib/config.hpp"
#include "sgrna_lib/targets.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace sgrna_lib {

namespace {

template <typename T>
void overlay(const nlohmann::json &j, const char *key, T &field) {
  if (!j.contains(key)) return;
  try {
    field = j.at(key).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Bad config value for '") + key + "': " + e.what());
  }
}

void apply(const nlohmann::json &j, LibraryConfig &config) {
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");
  overlay(j, "pam", config.pam);
  if (j.contains("target_length")) {
    int64_t len = 0;
    overlay(j, "target_length", len);
    if (len <= 0 || len > static_cast<int64_t>(kMaxTargetLength)) {
      throw std::runtime_error("Bad config value for 'target_length': " + std::to_string(len) +
                               " is outside [1, " + std::to_string(kMaxTargetLength) + "]");
    }
    config.target_length = static_cast<uint32_t>(len);
  }
  overlay(j, "tolerances", config.tolerances);
  overlay(j, "allow_partial_overlap", config.allow_partial_overlap);
  overlay(j, "quality", config.quality);
  overlay(j, "seed_mismatches", config.seed_mismatches);
  overlay(j, "seed_length", config.seed_length);
  overlay(j, "threads", config.threads);
  overlay(j, "chunk_mbs", config.chunk_mbs);
  overlay(j, "bowtie", config.bowtie);
  overlay(j, "bowtie_build", config.bowtie_build);
}

} // namespace

void load_config(const std::string &json_path, LibraryConfig &config) {
  std::ifstream in(json_path);
  if (!in) throw std::runtime_error("Failed to open config: " + json_path);
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Failed to parse config " + json_path + ": " + e.what());
  }
  sgrna_lib::apply(j, config);
}

void load_config_text(const std::string &json_text, LibraryConfig &config) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
  }
  sgrna_lib::apply(j, config);
}

std::vector<int> parse_tolerance_list(const std::string &s) {
  std::vector<int> out;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ',')) {
    size_t used = 0;
    int v = 0;
    try {
      v = std::stoi(item, &used);
    } catch (const std::exception &) {
      throw std::invalid_argument("Bad tolerance list: " + s);
    }
    if (used != item.size()) throw std::invalid_argument("Bad tolerance list: " + s);
    out.push_back(v);
  }
  if (out.empty()) throw std::invalid_argument("Empty tolerance list");
  return out;
}

} // namespace sgrna_lib
