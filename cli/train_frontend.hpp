#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "mdlvocab/corpus.hpp"
#include "mdlvocab/corpus_reader.hpp"
#include "mdlvocab/trainer.hpp"
#include "train_config.hpp"

std::unordered_map<std::string, std::string> read_env_file(const std::string &path);
void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env);

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path = ".env");
void print_train_usage();
bool parse_train_args(int argc, char **argv, Config &cfg, std::string &err, bool &show_help);
bool validate_config(const Config &cfg, std::string &err);

std::vector<std::string> expand_data_glob(const std::string &pattern);

mdlvocab::TrainerOptions make_trainer_options(const Config &cfg);
mdlvocab::CorpusOptions make_corpus_options(const Config &cfg);
mdlvocab::CorpusReadOptions make_read_options(const Config &cfg);

// Re-encodes `corpus` with the final codebook and returns its first `count` records.
std::vector<std::string> sample_final_segmentation(mdlvocab::Corpus &corpus, const mdlvocab::Codebook &codebook,
                                                   std::size_t count);
