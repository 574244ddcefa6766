#include "train_frontend.hpp"

#include "mdlvocab/corpus.hpp"
#include "mdlvocab/observer.hpp"
#include "mdlvocab/trainer.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    Config cfg;

    cfg.env_path = detect_env_path_arg(argc, argv, cfg.env_path);
    auto env = read_env_file(cfg.env_path);
    apply_env_overrides(cfg, env);

    std::string parse_err;
    bool show_help = false;
    if (!parse_train_args(argc, argv, cfg, parse_err, show_help))
    {
        if (show_help)
        {
            print_train_usage();
            return 0;
        }
        std::cerr << parse_err << "\n";
        print_train_usage();
        return 1;
    }

    auto files = expand_data_glob(cfg.data_glob);
    if (files.empty())
    {
        std::cerr << "No files matched: " << cfg.data_glob << "\n";
        return 1;
    }

    if (!cfg.quiet)
    {
        std::cerr << "Files: " << files.size() << "\n";
        std::cerr << "Iterations: " << cfg.iterations << " min_count: " << cfg.min_count
                  << " vocab_size: " << cfg.vocab_size << " threshold: " << cfg.threshold << "\n";
    }

    try
    {
        auto corpus = mdlvocab::Corpus::FromFiles(files, make_corpus_options(cfg), make_read_options(cfg));
        if (!cfg.quiet)
        {
            std::cerr << "Records: " << corpus.RecordCount() << " segments: " << corpus.SegmentCount()
                      << " tokens: " << corpus.DataLen() << "\n";
        }

        std::unique_ptr<mdlvocab::LogObserver> observer;
        if (!cfg.quiet)
        {
            observer = std::make_unique<mdlvocab::LogObserver>(std::cerr, cfg.progress_interval_ms);
        }
        mdlvocab::MdlTrainer trainer(make_trainer_options(cfg), observer.get());
        auto result = trainer.Train(corpus);

        if (cfg.verbose)
        {
            std::cerr << "Final segmentation:\n";
            for (const auto &line : sample_final_segmentation(corpus, result.codebook, cfg.sample_count))
            {
                std::cerr << "  | " << line << "\n";
            }
        }

        if (!cfg.output_path.empty())
        {
            corpus.ApplyCodebook(result.codebook);
            corpus.WriteSegmented(cfg.output_path);
            if (!cfg.quiet)
            {
                std::cerr << "Saved segmented text: " << cfg.output_path << "\n";
            }
        }

        result.codebook.Save(cfg.codebook_path);
        std::cerr << "Saved codebook: " << cfg.codebook_path << " (" << result.codebook.Size() << " tokens, "
                  << mdlvocab::TrainStateName(result.final_state) << ")\n";
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Training failed: " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
