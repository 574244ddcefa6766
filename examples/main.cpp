#include <iostream>
#include <string>
#include <vector>

#include "mdlvocab/corpus.hpp"
#include "mdlvocab/observer.hpp"
#include "mdlvocab/trainer.hpp"

int main() {
  using namespace mdlvocab;

  std::vector<std::string> lines = {
      "the cat sat on the mat, the cat ran.",
      "the rat sat on the cat.",
      "a cat and a rat sat together.",
      "the mat is flat, the cat is fat.",
  };

  Corpus corpus;
  for (const auto& line : lines) {
    corpus.AddRecord(line);
  }

  TrainerOptions opts;
  opts.iterations = 3;
  opts.min_count = 2;
  opts.vocab_size = 200;
  LogObserver observer(std::cerr);
  MdlTrainer trainer(opts, &observer);

  auto result = trainer.Train(corpus);
  result.codebook.Save("codebook.tsv");

  corpus.ApplyCodebook(result.codebook);
  for (std::size_t i = 0; i < corpus.RecordCount(); ++i) {
    std::cout << corpus.RenderRecord(i) << '\n';
  }
  return 0;
}
