#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "mdlvocab/codebook.hpp"
#include "mdlvocab/formats.hpp"

int main() {
  using namespace mdlvocab;

  Codebook codebook({{"a", 3}, {"b", 2}, {"z", 0}}, {",", "a"});
  assert(codebook.Size() == 3);
  assert(!codebook.Contains("z"));
  assert(codebook.Get(",") == 1);
  assert(codebook.IsProtected(","));
  // A stopword already in the alphabet keeps its count.
  assert(codebook.Get("a") == 3);

  // Counts below 1 remove the key.
  codebook.Add("b", -2);
  assert(!codebook.Contains("b"));
  codebook.Add("b", -1);
  assert(!codebook.Contains("b"));
  codebook.Add("ab", 2);
  assert(codebook.Get("ab") == 2);
  codebook.Add("ab", -5);
  assert(!codebook.Contains("ab"));
  codebook.Add("q", 0);
  assert(!codebook.Contains("q"));

  // Protected tokens ignore every delta.
  codebook.Add(",", -10);
  codebook.Add("a", -3);
  assert(codebook.Get(",") == 1);
  assert(codebook.Get("a") == 3);

  Codebook sorted({{"x", 2}, {"b", 5}, {"a", 2}}, {});
  auto entries = sorted.SortedEntries();
  assert(entries.size() == 3);
  assert(entries[0].first == "b");
  assert(entries[1].first == "a");
  assert(entries[2].first == "x");

  const auto dir = std::filesystem::temp_directory_path() / "mdlvocab_codebook_test";
  std::filesystem::create_directories(dir);

  const auto tsv_path = (dir / "codebook.tsv").string();
  sorted.Save(tsv_path);
  {
    std::ifstream in(tsv_path);
    std::stringstream ss;
    ss << in.rdbuf();
    assert(ss.str() == "b\t5\na\t2\nx\t2\n");
  }

  const auto json_path = (dir / "codebook.json").string();
  sorted.Save(json_path);
  {
    std::ifstream in(json_path);
    auto j = nlohmann::json::parse(in);
    assert(j.size() == 3);
    assert(j["b"].get<Count>() == 5);
    assert(j["x"].get<Count>() == 2);
  }

  bool threw = false;
  try {
    SaveCodebookTsv(sorted, (dir / "missing" / "codebook.tsv").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
  return 0;
}
