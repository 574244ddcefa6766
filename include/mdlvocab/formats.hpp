#pragma once

#include <string>

#include "mdlvocab/codebook.hpp"

namespace mdlvocab {

void SaveCodebookJson(const Codebook& codebook, const std::string& json_path);

void SaveCodebookTsv(const Codebook& codebook, const std::string& tsv_path);

}  // namespace mdlvocab
