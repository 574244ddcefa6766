#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <utility>
#include <vector>

#include "mdlvocab/codebook.hpp"
#include "mdlvocab/corpus.hpp"
#include "mdlvocab/corpus_reader.hpp"
#include "mdlvocab/observer.hpp"
#include "mdlvocab/trainer.hpp"

namespace py = pybind11;
using namespace mdlvocab;

PYBIND11_MODULE(pymdlvocab, m) {
  py::enum_<TrainState>(m, "TrainState")
      .value("seeded", TrainState::seeded)
      .value("stats_collected", TrainState::stats_collected)
      .value("candidates_selected", TrainState::candidates_selected)
      .value("committing", TrainState::committing)
      .value("converged", TrainState::converged)
      .value("capped", TrainState::capped)
      .value("epoch_done", TrainState::epoch_done);

  py::class_<TrainerOptions>(m, "TrainerOptions")
      .def(py::init<>())
      .def_readwrite("iterations", &TrainerOptions::iterations)
      .def_readwrite("min_count", &TrainerOptions::min_count)
      .def_readwrite("vocab_size", &TrainerOptions::vocab_size)
      .def_readwrite("threshold", &TrainerOptions::threshold)
      .def_readwrite("candidate_pool_ratio", &TrainerOptions::candidate_pool_ratio)
      .def_readwrite("verbose", &TrainerOptions::verbose)
      .def_readwrite("sample_count", &TrainerOptions::sample_count);

  py::class_<CorpusOptions>(m, "CorpusOptions")
      .def(py::init<>())
      .def_readwrite("stopwords", &CorpusOptions::stopwords)
      .def_readwrite("append_eos", &CorpusOptions::append_eos)
      .def_readwrite("max_chars_per_record", &CorpusOptions::max_chars_per_record);

  py::class_<CorpusReadOptions>(m, "CorpusReadOptions")
      .def(py::init<>())
      .def_readwrite("json_text_fields", &CorpusReadOptions::json_text_fields);

  py::class_<Codebook>(m, "Codebook")
      .def("get", &Codebook::Get)
      .def("__contains__", &Codebook::Contains)
      .def("__len__", &Codebook::Size)
      .def("counts", &Codebook::Counts)
      .def("entries", &Codebook::SortedEntries)
      .def("save", &Codebook::Save, py::arg("path"));

  py::class_<EpochReport>(m, "EpochReport")
      .def_readonly("epoch", &EpochReport::epoch)
      .def_readonly("state", &EpochReport::state)
      .def_readonly("pair_count", &EpochReport::pair_count)
      .def_readonly("candidate_count", &EpochReport::candidate_count)
      .def_readonly("attempted", &EpochReport::attempted)
      .def_readonly("committed", &EpochReport::committed)
      .def_readonly("vocab_before", &EpochReport::vocab_before)
      .def_readonly("vocab_after", &EpochReport::vocab_after);

  py::class_<TrainResult>(m, "TrainResult")
      .def_readonly("codebook", &TrainResult::codebook)
      .def_readonly("final_state", &TrainResult::final_state)
      .def_readonly("log_base", &TrainResult::log_base)
      .def_readonly("alphabet_size", &TrainResult::alphabet_size)
      .def_readonly("epochs", &TrainResult::epochs);

  py::class_<Corpus>(m, "Corpus")
      .def(py::init<CorpusOptions>(), py::arg("options") = CorpusOptions{})
      .def_static("from_files", &Corpus::FromFiles, py::arg("files"), py::arg("options") = CorpusOptions{},
                  py::arg("read_options") = CorpusReadOptions{})
      .def("add_record", [](Corpus& self, const std::string& text) { self.AddRecord(text); })
      .def("apply_codebook", &Corpus::ApplyCodebook)
      .def("render", &Corpus::RenderRecord)
      .def("write_segmented", &Corpus::WriteSegmented)
      .def("__len__", &Corpus::RecordCount);

  py::class_<MdlTrainer>(m, "MdlTrainer")
      .def(py::init([](TrainerOptions opts) { return MdlTrainer(opts); }),
           py::arg("options") = TrainerOptions{})
      .def("train", [](const MdlTrainer& self, Corpus& corpus) { return self.Train(corpus); })
      .def("train_from_lines", [](const MdlTrainer& self, const std::vector<std::string>& lines,
                                  CorpusOptions options) {
        Corpus corpus(std::move(options));
        for (const auto& line : lines) {
          corpus.AddRecord(line);
        }
        return self.Train(corpus);
      }, py::arg("lines"), py::arg("options") = CorpusOptions{});
}
