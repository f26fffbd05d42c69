#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/query/RecordQuery.hpp"
#include "core/record/Record.hpp"
#include "core/record/VaultError.hpp"
#include "core/stats/VaultStatistics.hpp"

namespace vault {

class RecordStore;
class LocalFSBackend;

// Outcome of one vault operation, handed back to whichever driver called it.
struct OpResult {
  ErrorKind                 error = ErrorKind::None;
  std::string               message;
  std::vector<Record>       records;
  std::optional<VaultStats> stats;
  std::string               artifact;   // backup or export file written

  bool ok() const { return error == ErrorKind::None; }
};

// The eight vault operations. Every error from the layers below is caught
// here and reported through OpResult; nothing escapes to the driver.
//
// Add and Delete write a full backup after the store commits. If the backup
// fails the mutation stays committed and the result is IoFailure.
class VaultController {
public:
  VaultController(RecordStore& store, LocalFSBackend& files)
    : store_(store), files_(files), query_(store) {}

  OpResult addRecord(const std::string& name, const std::string& details = {});
  OpResult updateRecord(const std::string& id,
                        const std::string& newName = {},
                        const std::string& newDetails = {});
  OpResult deleteRecord(const std::string& id, bool confirmed);
  OpResult listRecords();
  OpResult searchRecords(const std::string& mode, const std::string& term);
  OpResult sortRecords(const std::string& field, const std::string& direction);
  OpResult exportData();
  OpResult viewStatistics();

private:
  template <typename Fn>
  OpResult guarded(const char* op, Fn&& fn);

  std::string backup();

  RecordStore&    store_;
  LocalFSBackend& files_;
  RecordQuery     query_;
};

} // namespace vault
