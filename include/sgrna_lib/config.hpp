#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sgrna_lib {

struct LibraryConfig {
  std::string pam{"NGG"};
  uint32_t target_length{20};
  std::vector<int> tolerances{39, 30, 20, 11, 1};
  bool allow_partial_overlap{true};
  std::string quality{"I4!=======44444++++++++"};
  int seed_mismatches{3};
  int seed_length{15};
  int threads{6};
  int chunk_mbs{256};
  std::string bowtie{"bowtie"};
  std::string bowtie_build{"bowtie-build"};
};

// Overlay keys present in a JSON object onto `config`; absent keys keep their
// current value. Throws std::runtime_error on unreadable files or bad types.
void load_config(const std::string &json_path, LibraryConfig &config);
void load_config_text(const std::string &json_text, LibraryConfig &config);

// "39,30,20" -> {39, 30, 20}. Throws std::invalid_argument on bad input.
std::vector<int> parse_tolerance_list(const std::string &s);

} // namespace sgrna_lib
