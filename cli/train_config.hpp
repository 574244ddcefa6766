#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct Config
{
    std::string env_path = ".env";
    std::string data_glob;
    std::string codebook_path = "codebook";
    std::string output_path; // segmented training text, empty -> not written
    std::vector<std::string> text_fields = {"text", "content"};
    std::vector<std::string> stopwords; // empty -> built-in punctuation set

    std::size_t iterations = 5;
    std::size_t min_count = 5;
    std::size_t vocab_size = 20000;
    double threshold = 0.8;
    double candidate_pool_ratio = 0.5;
    std::size_t max_chars_per_record = 0; // 0 -> unlimited
    std::size_t sample_count = 5;
    std::size_t progress_interval_ms = 1000;
    bool verbose = false;
    bool quiet = false;
};
