#include "result_archive.h"
#include "utils/easylog.h"
#include <filesystem>
#include <iterator>
#include <ranges>
#include <nlohmann/json.hpp>

namespace {
struct LoadedJournal {
  ResultArchive::RecordMap records;
  // Whether the last line is truncated and thus dropped, or lacks its line break
  bool needs_compaction;
};

auto load_journal(const std::string& path) -> rfl::Result<LoadedJournal> try {
  auto fin = std::ifstream{path};
  if (!fin.is_open()) {
    return rfl::Error{fmt::format("Failed to open archive file '{}'.", path)};
  }
  auto contents = std::string(std::istreambuf_iterator<char>{fin}, std::istreambuf_iterator<char>{});
  auto lines = std::vector<std::string>{};
  for (auto line : contents | views::split('\n')) {
    if (!ranges::empty(line)) {
      lines.emplace_back(line.begin(), line.end());
    }
  }
  // Later appends would be glued to the last line otherwise.
  auto res = LoadedJournal{.records = {}, .needs_compaction = !contents.empty() && contents.back() != '\n'};
  if (res.needs_compaction) {
    ELOGFMT(WARNING, "The last line of archive file '{}' lacks its line break.", path);
  }
  for (auto [line_index, line] : views::enumerate(lines)) {
    auto is_last = (line_index + 1 == ssize(lines));
    auto json_obj = json::parse(line, nullptr, false);
    if (json_obj.is_discarded()) {
      if (is_last) {
        ELOGFMT(WARNING, "Drops the truncated last line (line #{}) of archive file '{}'.", line_index + 1, path);
        res.needs_compaction = true;
        break;
      }
      return rfl::Error{fmt::format("Archive file '{}' is corrupted: malformed line #{}.", path, line_index + 1)};
    }
    auto record = result_record_from_json(json_obj);
    if (!record) {
      constexpr auto msg_pattern = "Archive file '{}' is corrupted: invalid record at line #{}: {}";
      return rfl::Error{fmt::format(msg_pattern, path, line_index + 1, record.error()->what())};
    }
    auto key = record->key();
    auto [it, inserted] = res.records.emplace(key, std::move(*record));
    if (!inserted) {
      constexpr auto msg_pattern = "Archive file '{}' is corrupted: duplicated record {} at line #{}.";
      return rfl::Error{fmt::format(msg_pattern, path, to_string(key), line_index + 1)};
    }
  }
  return res;
}
RFL_RESULT_CATCH_HANDLER()

// Rewrites the journal with the loaded records only.
auto compact_journal(const std::string& path, const ResultArchive::RecordMap& records) -> ResultVoid try {
  auto temp_path = path + ".compact";
  {
    auto fout = std::ofstream{temp_path};
    if (!fout.is_open()) {
      return rfl::Error{fmt::format("Failed to open temporary file '{}' for compaction.", temp_path)};
    }
    for (const auto& record : records | views::values) {
      fout << result_record_to_json(record).dump() << '\n';
    }
    if (!fout.flush()) {
      return rfl::Error{fmt::format("Failed to write to temporary file '{}'.", temp_path)};
    }
  }
  std::filesystem::rename(temp_path, path);
  ELOGFMT(INFO, "Archive file '{}' compacted with {} records.", path, records.size());
  return RESULT_VOID_SUCCESS;
}
RFL_RESULT_CATCH_HANDLER()
} // namespace

auto ResultArchive::open(const std::string& path) -> rfl::Result<ResultArchive> try {
  auto records = RecordMap{};
  if (std::filesystem::exists(path)) {
    auto loaded = load_journal(path);
    RFL_RETURN_ON_ERROR(loaded);
    if (loaded->needs_compaction) {
      auto compact_res = compact_journal(path, loaded->records);
      RFL_RETURN_ON_ERROR(compact_res);
    }
    records = std::move(loaded->records);
    ELOGFMT(INFO, "Done loading {} records from archive file '{}'.", records.size(), path);
  }
  auto journal = std::make_unique<std::ofstream>(path, std::ios::app);
  if (!journal->is_open()) {
    return rfl::Error{fmt::format("Failed to open archive file '{}' for appending.", path)};
  }
  return ResultArchive{path, std::move(records), std::move(journal)};
}
RFL_RESULT_CATCH_HANDLER()

auto ResultArchive::insert(ResultRecord record) -> ResultVoid try {
  auto key = record.key();
  if (records_.contains(key)) {
    return rfl::Error{fmt::format("Record {} already exists in archive '{}'.", to_string(key), path_)};
  }
  *journal_ << result_record_to_json(record).dump() << '\n';
  if (!journal_->flush()) {
    return rfl::Error{fmt::format("Failed to append record {} to archive file '{}'.", to_string(key), path_)};
  }
  records_.emplace(key, std::move(record));
  VNEPLOG_FMT_TRACE("Record {} appended to archive '{}'.", to_string(key), path_);
  return RESULT_VOID_SUCCESS;
}
RFL_RESULT_CATCH_HANDLER()
