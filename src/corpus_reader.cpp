#include "mdlvocab/corpus_reader.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <lzma.h>
#include <nlohmann/json.hpp>
#include <zlib.h>

namespace mdlvocab {

namespace {

bool EmitTextField(const nlohmann::json& j, const std::vector<std::string>& fields, const RecordFn& fn) {
  if (!j.is_object()) {
    return false;
  }
  for (const auto& field : fields) {
    auto it = j.find(field);
    if (it != j.end() && it->is_string()) {
      fn(it->get<std::string>());
      return true;
    }
  }
  return false;
}

void StripCr(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

}  // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

bool CorpusReader::ForEachRecord(const std::string& path, const RecordFn& fn) const {
  const auto ext = std::filesystem::path(path).extension().string();
  if (ext == ".jsonl") return ReadJsonl(path, fn);
  if (ext == ".json") return ReadJson(path, fn);
  if (ext == ".gz") return ReadGz(path, fn);
  if (ext == ".xz") return ReadXz(path, fn);
  return ReadTextLines(path, fn);
}

bool CorpusReader::ReadTextLines(const std::string& path, const RecordFn& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    StripCr(line);
    if (!line.empty()) fn(line);
  }
  return true;
}

bool CorpusReader::ReadJsonl(const std::string& path, const RecordFn& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    StripCr(line);
    if (line.empty()) continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) continue;
    EmitTextField(j, options_.json_text_fields, fn);
  }
  return true;
}

bool CorpusReader::ReadJson(const std::string& path, const RecordFn& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) return false;
  if (j.is_array()) {
    for (const auto& item : j) {
      EmitTextField(item, options_.json_text_fields, fn);
    }
  } else {
    EmitTextField(j, options_.json_text_fields, fn);
  }
  return true;
}

bool CorpusReader::ReadGz(const std::string& path, const RecordFn& fn) const {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) return false;
  std::string payload;
  char buf[1 << 15];
  int read_n = 0;
  while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
    payload.append(buf, static_cast<size_t>(read_n));
  }
  const bool ok = read_n == 0;
  gzclose(gz);
  if (!ok) return false;

  EmitPayload(payload, fn);
  return true;
}

bool CorpusReader::ReadXz(const std::string& path, const RecordFn& fn) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;

  lzma_stream strm = LZMA_STREAM_INIT;
  if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
    return false;
  }

  std::vector<std::uint8_t> in_buf(1 << 16);
  std::vector<std::uint8_t> out_buf(1 << 16);
  std::string payload;
  lzma_action action = LZMA_RUN;
  bool eof = false;
  bool ok = true;

  while (true) {
    if (strm.avail_in == 0 && !eof) {
      in.read(reinterpret_cast<char*>(in_buf.data()), static_cast<std::streamsize>(in_buf.size()));
      const std::streamsize got = in.gcount();
      strm.next_in = in_buf.data();
      strm.avail_in = static_cast<std::size_t>(got);
      if (got == 0) {
        eof = true;
        action = LZMA_FINISH;
      }
    }

    strm.next_out = out_buf.data();
    strm.avail_out = out_buf.size();
    const lzma_ret ret = lzma_code(&strm, action);
    const std::size_t produced = out_buf.size() - strm.avail_out;
    payload.append(reinterpret_cast<const char*>(out_buf.data()), produced);

    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK || (eof && strm.avail_in == 0 && produced == 0)) {
      ok = false;
      break;
    }
  }
  lzma_end(&strm);
  if (!ok) return false;

  EmitPayload(payload, fn);
  return true;
}

void CorpusReader::EmitPayload(const std::string& payload, const RecordFn& fn) const {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (!j.is_discarded() && (j.is_array() || j.is_object())) {
    if (j.is_array()) {
      for (const auto& item : j) {
        EmitTextField(item, options_.json_text_fields, fn);
      }
    } else {
      EmitTextField(j, options_.json_text_fields, fn);
    }
    return;
  }

  // JSON lines; anything that is not an object with a text field is plain text.
  std::istringstream iss(payload);
  std::string line;
  while (std::getline(iss, line)) {
    StripCr(line);
    if (line.empty()) continue;
    auto jl = nlohmann::json::parse(line, nullptr, false);
    if (!jl.is_discarded() && EmitTextField(jl, options_.json_text_fields, fn)) {
      continue;
    }
    if (jl.is_discarded() || !jl.is_object()) {
      fn(line);
    }
  }
}

}  // namespace mdlvocab
