#pragma once

#include <functional>
#include <string>
#include <vector>

namespace mdlvocab {

struct CorpusReadOptions {
  std::vector<std::string> json_text_fields = {"text", "content"};
};

using RecordFn = std::function<void(const std::string&)>;

// Streams text records out of a corpus file. Dispatch is by extension:
// .txt (and anything unknown) yields one record per line, .jsonl/.json pull
// the first string field found in `json_text_fields`, .gz/.xz are decoded
// and then parsed as JSON, JSON lines or plain text.
class CorpusReader {
 public:
  explicit CorpusReader(CorpusReadOptions options = {});

  // False when the file cannot be opened or decoded.
  bool ForEachRecord(const std::string& path, const RecordFn& fn) const;

 private:
  bool ReadTextLines(const std::string& path, const RecordFn& fn) const;
  bool ReadJsonl(const std::string& path, const RecordFn& fn) const;
  bool ReadJson(const std::string& path, const RecordFn& fn) const;
  bool ReadGz(const std::string& path, const RecordFn& fn) const;
  bool ReadXz(const std::string& path, const RecordFn& fn) const;

  void EmitPayload(const std::string& payload, const RecordFn& fn) const;

  CorpusReadOptions options_;
};

}  // namespace mdlvocab
