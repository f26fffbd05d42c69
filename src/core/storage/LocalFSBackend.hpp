#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/record/Record.hpp"

namespace vault {

// Writes vault snapshots to the local filesystem. Never touches the store.
// Write failures throw IoError.
class LocalFSBackend {
public:
  LocalFSBackend(std::string backupRoot, std::string exportPath)
    : backupRoot_(std::move(backupRoot)), exportPath_(std::move(exportPath)) {}

  // Creates the backup directory (and parents) if missing. Idempotent.
  void ensureBackupDir() const;

  // Writes records as a pretty-printed JSON array to a new
  // backup_<stamp>.json file; returns its path. Never overwrites.
  std::string writeBackup(const std::vector<Record>& records, int64_t at) const;

  // Overwrites the export report; returns its path.
  std::string writeExport(const std::vector<Record>& records, int64_t at) const;

  const std::string& backupRoot() const { return backupRoot_; }
  const std::string& exportPath() const { return exportPath_; }

private:
  std::string backupRoot_;
  std::string exportPath_;
};

} // namespace vault
