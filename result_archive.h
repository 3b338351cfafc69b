#pragma once

#include "result_types.h"
#include <fstream>
#include <memory>

// Persisted keyed collection of result records, backed by a JSON Lines journal:
// every inserted record is appended as one line and flushed at once, so that a crashed batch run
// loses at most the record being written.
//
// Not internally synchronized. Concurrent writers shall serialize the calls to insert().
class ResultArchive {
public:
  using RecordMap = std::map<ArchiveKey, ResultRecord>;

  // Creates the journal file if absent. Otherwise, all the records are loaded from it.
  // A truncated last line (which is caused by a crash during writing) is dropped with a warning
  // and the journal is compacted. Malformed lines elsewhere or duplicated keys are treated as corruption.
  static auto open(const std::string& path) -> rfl::Result<ResultArchive>;

  auto contains(const ArchiveKey& key) const -> bool {
    return records_.contains(key);
  }

  // Returns nullptr if absent.
  auto find(const ArchiveKey& key) const -> const ResultRecord* {
    auto it = records_.find(key);
    return it == records_.end() ? nullptr : &it->second;
  }

  // Fails if a record with the same key exists, or on I/O errors.
  auto insert(ResultRecord record) -> ResultVoid;

  // Ordered by key
  auto records() const -> const RecordMap& {
    return records_;
  }

  auto size() const -> size_t {
    return records_.size();
  }

  auto path() const -> const std::string& {
    return path_;
  }

private:
  ResultArchive(std::string path, RecordMap records, std::unique_ptr<std::ofstream> journal)
      : path_(std::move(path)), records_(std::move(records)), journal_(std::move(journal)) {}

  std::string path_;
  RecordMap records_;
  std::unique_ptr<std::ofstream> journal_;
};
