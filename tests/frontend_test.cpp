#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "train_frontend.hpp"

namespace
{
struct Argv
{
    explicit Argv(std::vector<std::string> args) : storage(std::move(args))
    {
        for (auto &s : storage)
        {
            ptrs.push_back(s.data());
        }
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char **argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char *> ptrs;
};

bool parse(Config &cfg, std::vector<std::string> args, std::string &err, bool &show_help)
{
    args.insert(args.begin(), "mdlvocab_train");
    Argv a(std::move(args));
    return parse_train_args(a.argc(), a.argv(), cfg, err, show_help);
}
} // namespace

int main()
{
    const auto dir = std::filesystem::temp_directory_path() / "mdlvocab_frontend_test";
    std::filesystem::create_directories(dir);

    const auto env_path = (dir / "train.env").string();
    {
        std::ofstream out(env_path, std::ios::binary);
        out << "\xEF\xBB\xBF# training corpus\n"
            << "DATA_PATH=\"corpus/*.jsonl\"\n"
            << "ITERATIONS = 7\n"
            << "THRESHOLD='0.5'\n"
            << "MIN_COUNT=lots\n"
            << "TEXT_FIELD=body, text\n"
            << "STOPWORDS=,;.\n"
            << "VERBOSE=yes\n"
            << "not a pair\n";
    }

    auto env = read_env_file(env_path);
    assert(env.at("DATA_PATH") == "corpus/*.jsonl");
    assert(env.at("ITERATIONS") == "7");
    assert(env.count("not a pair") == 0);
    assert(read_env_file((dir / "missing.env").string()).empty());

    Config cfg;
    apply_env_overrides(cfg, env);
    assert(cfg.data_glob == "corpus/*.jsonl");
    assert(cfg.iterations == 7);
    assert(cfg.threshold == 0.5);
    assert(cfg.min_count == 5);
    assert(cfg.text_fields.size() == 2);
    assert(cfg.text_fields[0] == "body");
    assert(cfg.stopwords.empty() == false);
    assert(cfg.verbose);

    // Arguments win over the environment.
    std::string err;
    bool show_help = false;
    assert(parse(cfg, {"--iterations", "9", "-c", "out.json", "--candidate-ratio", "0.25", "--quiet"}, err,
                 show_help));
    assert(cfg.iterations == 9);
    assert(cfg.threshold == 0.5);
    assert(cfg.codebook_path == "out.json");
    assert(cfg.candidate_pool_ratio == 0.25);
    assert(cfg.quiet);

    auto rejects = [](std::vector<std::string> args) {
        Config c;
        c.data_glob = "x.txt";
        std::string e;
        bool help = false;
        bool ok = parse(c, std::move(args), e, help);
        return !ok && !help && !e.empty();
    };
    assert(rejects({"--threshold", "0"}));
    assert(rejects({"--threshold", "1.5"}));
    assert(rejects({"--vocab-size", "abc"}));
    assert(rejects({"--vocab-size", "0"}));
    assert(rejects({"--min-count", "-3"}));
    assert(rejects({"--iterations", "0"}));
    assert(rejects({"--candidate-ratio", "0"}));
    assert(rejects({"--iterations"}));
    assert(rejects({"--bogus"}));

    {
        Config c;
        std::string e;
        bool help = false;
        assert(!parse(c, {}, e, help));
        assert(e.find("DATA_PATH") != std::string::npos);
        assert(!parse(c, {"--help"}, e, help));
        assert(help);
    }

    {
        Argv a({"mdlvocab_train", "--env", "custom.env", "-t", "x"});
        assert(detect_env_path_arg(a.argc(), a.argv()) == "custom.env");
        Argv b({"mdlvocab_train", "-t", "x"});
        assert(detect_env_path_arg(b.argc(), b.argv()) == ".env");
    }

    {
        std::filesystem::create_directories(dir / "data" / "nested");
        std::ofstream(dir / "data" / "a.txt") << "a\n";
        std::ofstream(dir / "data" / "b.jsonl") << "{}\n";
        std::ofstream(dir / "data" / "nested" / "c.txt") << "c\n";

        const std::string base = (dir / "data").string();
        auto txt = expand_data_glob(base + "/*.txt");
        assert(txt.size() == 2);
        auto all = expand_data_glob(base + "/*");
        assert(all.size() == 3);
        assert(expand_data_glob(base + "/a.txt").size() == 1);
        assert(expand_data_glob(base + "/none.txt").empty());
    }

    {
        Config c;
        c.iterations = 2;
        c.min_count = 3;
        c.stopwords = {"|"};
        c.max_chars_per_record = 10;
        auto topts = make_trainer_options(c);
        assert(topts.iterations == 2);
        assert(topts.min_count == 3);
        auto copts = make_corpus_options(c);
        assert(copts.stopwords.size() == 1);
        assert(copts.max_chars_per_record == 10);
        Config d;
        assert(make_corpus_options(d).stopwords == mdlvocab::DefaultStopwords());
        assert(make_read_options(d).json_text_fields.size() == 2);
    }

    {
        mdlvocab::CorpusOptions opts;
        opts.stopwords.clear();
        opts.append_eos = false;
        mdlvocab::Corpus corpus(opts);
        corpus.AddRecord("ababab");
        corpus.AddRecord("abba");
        corpus.BuildVocab();
        mdlvocab::Codebook codebook({{"ab", 4}, {"b", 1}, {"a", 1}}, {});
        auto samples = sample_final_segmentation(corpus, codebook, 5);
        assert(samples.size() == 2);
        assert(samples[0] == "ab ab ab");
        assert(samples[1] == "ab b a");
        assert(sample_final_segmentation(corpus, codebook, 1).size() == 1);
    }

    std::filesystem::remove_all(dir);
    return 0;
}
