#include "mdlvocab/formats.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace mdlvocab {

void SaveCodebookJson(const Codebook& codebook, const std::string& json_path) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto& [token, count] : codebook.SortedEntries()) {
    j[token] = count;
  }

  std::ofstream out(json_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create codebook json: " + json_path);
  }
  out << j.dump(2) << '\n';
  if (!out) {
    throw std::runtime_error("failed to write codebook json: " + json_path);
  }
}

void SaveCodebookTsv(const Codebook& codebook, const std::string& tsv_path) {
  std::ofstream out(tsv_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("failed to create codebook file: " + tsv_path);
  }
  for (const auto& [token, count] : codebook.SortedEntries()) {
    out << token << '\t' << count << '\n';
  }
  if (!out) {
    throw std::runtime_error("failed to write codebook file: " + tsv_path);
  }
}

}  // namespace mdlvocab
