#include "train_frontend.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace
{
std::string trim(const std::string &s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_ascii(std::string s)
{
    for (char &c : s)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::vector<std::string> split_csv(const std::string &s)
{
    std::vector<std::string> out;
    std::string cur;
    for (char c : s)
    {
        if (c == ',')
        {
            out.push_back(trim(cur));
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    out.push_back(trim(cur));
    out.erase(std::remove_if(out.begin(), out.end(), [](const std::string &v) { return v.empty(); }), out.end());
    return out;
}

bool parse_size_value(const std::string &s, std::size_t &out)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        unsigned long long v = std::stoull(s, &pos, 10);
        if (pos != s.size() || v > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max()))
        {
            return false;
        }
        out = static_cast<std::size_t>(v);
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_double_value(const std::string &s, double &out)
{
    try
    {
        std::size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v))
        {
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

bool parse_bool_value(const std::string &s, bool &out)
{
    std::string v = to_lower_ascii(s);
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on")
    {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off")
    {
        out = false;
        return true;
    }
    return false;
}

std::string normalize_path(const std::string &s)
{
    std::string out = s;
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

bool wildcard_match(const std::string &pattern, const std::string &str)
{
    std::size_t p = 0;
    std::size_t s = 0;
    std::size_t star = std::string::npos;
    std::size_t match = 0;
    while (s < str.size())
    {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == str[s]))
        {
            ++p;
            ++s;
        }
        else if (p < pattern.size() && pattern[p] == '*')
        {
            star = p++;
            match = s;
        }
        else if (star != std::string::npos)
        {
            p = star + 1;
            s = ++match;
        }
        else
        {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*')
    {
        ++p;
    }
    return p == pattern.size();
}
} // namespace

std::unordered_map<std::string, std::string> read_env_file(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in)
    {
        return env;
    }
    bool first_line = true;
    std::string line;
    while (std::getline(in, line))
    {
        if (first_line)
        {
            first_line = false;
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
            {
                line.erase(0, 3);
            }
        }
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string val = trim(trimmed.substr(eq + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\'')))
        {
            val = val.substr(1, val.size() - 2);
        }
        env[key] = val;
    }
    return env;
}

void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    // Unparsable values keep the current setting.
    if (auto v = get("DATA_PATH"))
        cfg.data_glob = *v;
    if (auto v = get("CODEBOOK_PATH"))
        cfg.codebook_path = *v;
    if (auto v = get("OUTPUT_PATH"))
        cfg.output_path = *v;
    if (auto v = get("ITERATIONS"))
        parse_size_value(*v, cfg.iterations);
    if (auto v = get("MIN_COUNT"))
        parse_size_value(*v, cfg.min_count);
    if (auto v = get("VOCAB_SIZE"))
        parse_size_value(*v, cfg.vocab_size);
    if (auto v = get("THRESHOLD"))
        parse_double_value(*v, cfg.threshold);
    if (auto v = get("CANDIDATE_POOL_RATIO"))
        parse_double_value(*v, cfg.candidate_pool_ratio);
    if (auto v = get("MAX_CHARS_PER_RECORD"))
        parse_size_value(*v, cfg.max_chars_per_record);
    if (auto v = get("PROGRESS_INTERVAL_MS"))
        parse_size_value(*v, cfg.progress_interval_ms);
    if (auto v = get("VERBOSE"))
        parse_bool_value(*v, cfg.verbose);
    if (auto v = get("TEXT_FIELD"))
    {
        auto fields = split_csv(*v);
        if (!fields.empty())
        {
            cfg.text_fields = std::move(fields);
        }
    }
    if (auto v = get("STOPWORDS"))
    {
        cfg.stopwords = split_csv(*v);
    }
}

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path)
{
    std::string path = default_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--env" && i + 1 < argc)
        {
            path = argv[i + 1];
            ++i;
        }
    }
    return path;
}

void print_train_usage()
{
    std::cerr << "MDL subword vocabulary trainer\n"
              << "Usage:\n"
              << "  mdlvocab_train --train <glob> [options]\n\n"
              << "Options:\n"
              << "  --env <path>                Path to .env (default: .env)\n"
              << "  --train, -t <glob>          Unsegmented training text (overrides DATA_PATH)\n"
              << "  --codebook, -c <path>       Codebook output; .json -> JSON, else TSV (default: codebook)\n"
              << "  --output, -o <path>         Write the segmented training text\n"
              << "  --iterations, -i <n>        Training epochs (default: 5)\n"
              << "  --min-count <n>             Ignore pairs rarer than this (default: 5)\n"
              << "  --vocab-size <n>            Codebook size cap (default: 20000)\n"
              << "  --threshold <x>             Share of ranked candidates kept, in (0,1] (default: 0.8)\n"
              << "  --candidate-ratio <x>       Pair pool as a share of --vocab-size (default: 0.5)\n"
              << "  --text-field <csv>          JSON fields holding text (default: text,content)\n"
              << "  --max-chars <n>             Truncate records to N chars (default: 0=off)\n"
              << "  --stopwords <csv>           Protected tokens (default: punctuation)\n"
              << "  --samples <n>               Sample lines shown per epoch with --verbose (default: 5)\n"
              << "  --progress-interval <ms>    Progress update interval (default: 1000)\n"
              << "  --verbose, -v               Show sample segmentations between epochs\n"
              << "  --quiet, -q                 No progress output\n"
              << "  --help                      Show this help\n";
}

bool parse_train_args(int argc, char **argv, Config &cfg, std::string &err, bool &show_help)
{
    show_help = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto require_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };
        auto read_size = [&](const std::string &name, std::size_t &out) -> bool {
            const char *v = require_value(name);
            if (!v)
            {
                return false;
            }
            if (!parse_size_value(v, out))
            {
                err = "invalid " + name + ": " + v;
                return false;
            }
            return true;
        };
        auto read_double = [&](const std::string &name, double &out) -> bool {
            const char *v = require_value(name);
            if (!v)
            {
                return false;
            }
            if (!parse_double_value(v, out))
            {
                err = "invalid " + name + ": " + v;
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--env")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.env_path = v;
            continue;
        }
        if (arg == "--train" || arg == "-t")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.data_glob = v;
            continue;
        }
        if (arg == "--codebook" || arg == "-c")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.codebook_path = v;
            continue;
        }
        if (arg == "--output" || arg == "-o")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.output_path = v;
            continue;
        }
        if (arg == "--iterations" || arg == "-i")
        {
            if (!read_size(arg, cfg.iterations))
            {
                return false;
            }
            continue;
        }
        if (arg == "--min-count" || arg == "--min_count")
        {
            if (!read_size(arg, cfg.min_count))
            {
                return false;
            }
            continue;
        }
        if (arg == "--vocab-size" || arg == "--vocab_size")
        {
            if (!read_size(arg, cfg.vocab_size))
            {
                return false;
            }
            continue;
        }
        if (arg == "--threshold")
        {
            if (!read_double(arg, cfg.threshold))
            {
                return false;
            }
            continue;
        }
        if (arg == "--candidate-ratio")
        {
            if (!read_double(arg, cfg.candidate_pool_ratio))
            {
                return false;
            }
            continue;
        }
        if (arg == "--text-field")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            auto fields = split_csv(v);
            if (fields.empty())
            {
                err = "invalid --text-field";
                return false;
            }
            cfg.text_fields = std::move(fields);
            continue;
        }
        if (arg == "--max-chars")
        {
            if (!read_size(arg, cfg.max_chars_per_record))
            {
                return false;
            }
            continue;
        }
        if (arg == "--stopwords")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.stopwords = split_csv(v);
            continue;
        }
        if (arg == "--samples")
        {
            if (!read_size(arg, cfg.sample_count))
            {
                return false;
            }
            continue;
        }
        if (arg == "--progress-interval")
        {
            if (!read_size(arg, cfg.progress_interval_ms))
            {
                return false;
            }
            continue;
        }
        if (arg == "--verbose" || arg == "-v")
        {
            cfg.verbose = true;
            continue;
        }
        if (arg == "--quiet" || arg == "-q")
        {
            cfg.quiet = true;
            continue;
        }
        err = "unknown argument: " + arg;
        return false;
    }
    return validate_config(cfg, err);
}

bool validate_config(const Config &cfg, std::string &err)
{
    if (cfg.data_glob.empty())
    {
        err = "DATA_PATH not set in .env and --train not provided";
        return false;
    }
    if (cfg.iterations == 0)
    {
        err = "--iterations must be positive";
        return false;
    }
    if (cfg.min_count == 0)
    {
        err = "--min-count must be positive";
        return false;
    }
    if (cfg.vocab_size == 0)
    {
        err = "--vocab-size must be positive";
        return false;
    }
    if (!(cfg.threshold > 0.0 && cfg.threshold <= 1.0))
    {
        err = "--threshold must be in (0, 1]";
        return false;
    }
    if (!(cfg.candidate_pool_ratio > 0.0))
    {
        err = "--candidate-ratio must be positive";
        return false;
    }
    if (cfg.codebook_path.empty())
    {
        err = "--codebook must not be empty";
        return false;
    }
    return true;
}

std::vector<std::string> expand_data_glob(const std::string &pattern)
{
    std::vector<std::string> out;
    std::string norm_pattern = normalize_path(pattern);
    auto first_wild = norm_pattern.find_first_of("*?");
    if (first_wild == std::string::npos)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(pattern, ec))
        {
            out.push_back(pattern);
        }
        return out;
    }
    auto last_sep = norm_pattern.substr(0, first_wild).find_last_of('/');
    std::filesystem::path base_dir = ".";
    if (last_sep != std::string::npos)
    {
        base_dir = pattern.substr(0, last_sep);
    }
    std::error_code ec;
    if (!std::filesystem::exists(base_dir, ec))
    {
        return out;
    }
    for (std::filesystem::recursive_directory_iterator it(base_dir, ec), end; it != end; it.increment(ec))
    {
        if (ec)
        {
            break;
        }
        if (!it->is_regular_file())
        {
            continue;
        }
        std::string cand = normalize_path(it->path().string());
        if (last_sep == std::string::npos && cand.rfind("./", 0) == 0)
        {
            cand.erase(0, 2);
        }
        if (wildcard_match(norm_pattern, cand))
        {
            out.push_back(it->path().string());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

mdlvocab::TrainerOptions make_trainer_options(const Config &cfg)
{
    mdlvocab::TrainerOptions opts;
    opts.iterations = cfg.iterations;
    opts.min_count = static_cast<mdlvocab::Count>(cfg.min_count);
    opts.vocab_size = cfg.vocab_size;
    opts.threshold = cfg.threshold;
    opts.candidate_pool_ratio = cfg.candidate_pool_ratio;
    opts.verbose = cfg.verbose;
    opts.sample_count = cfg.sample_count;
    return opts;
}

mdlvocab::CorpusOptions make_corpus_options(const Config &cfg)
{
    mdlvocab::CorpusOptions opts;
    if (!cfg.stopwords.empty())
    {
        opts.stopwords = cfg.stopwords;
    }
    opts.max_chars_per_record = cfg.max_chars_per_record;
    return opts;
}

mdlvocab::CorpusReadOptions make_read_options(const Config &cfg)
{
    mdlvocab::CorpusReadOptions opts;
    opts.json_text_fields = cfg.text_fields;
    return opts;
}

std::vector<std::string> sample_final_segmentation(mdlvocab::Corpus &corpus, const mdlvocab::Codebook &codebook,
                                                   std::size_t count)
{
    corpus.ApplyCodebook(codebook);
    return corpus.SampleLines(count);
}
