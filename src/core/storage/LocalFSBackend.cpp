#include "LocalFSBackend.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/format/RecordFormat.hpp"
#include "core/record/VaultError.hpp"

namespace vault {

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& file, const std::string& body) {
  std::ofstream os(file, std::ios::binary | std::ios::trunc);
  if (!os) throw IoError("cannot open " + file.string() + " for writing");
  os.write(body.data(), static_cast<std::streamsize>(body.size()));
  os.flush();
  if (!os) throw IoError("failed writing " + file.string());
}

// Creates `file` only if it does not exist yet ("x" mode is O_EXCL).
// Returns false when the name is already taken.
bool write_new_file(const fs::path& file, const std::string& body) {
  std::FILE* f = std::fopen(file.string().c_str(), "wbx");
  if (!f) {
    if (errno == EEXIST) return false;
    throw IoError("cannot create " + file.string() + ": " + std::strerror(errno));
  }
  const bool written = std::fwrite(body.data(), 1, body.size(), f) == body.size();
  const bool closed = std::fclose(f) == 0;
  if (!written || !closed) throw IoError("failed writing " + file.string());
  return true;
}

} // namespace

void LocalFSBackend::ensureBackupDir() const {
  std::error_code ec;
  fs::create_directories(backupRoot_, ec);
  if (ec || !fs::is_directory(backupRoot_)) {
    throw IoError("cannot create backup directory " + backupRoot_ +
                  (ec ? ": " + ec.message() : std::string()));
  }
}

std::string LocalFSBackend::writeBackup(const std::vector<Record>& records, int64_t at) const {
  ensureBackupDir();

  const nlohmann::json doc = records;
  const std::string body = doc.dump(2);

  // Same-second backups get _1, _2, ... so each one is a new file.
  const std::string stem = "backup_" + backup_stamp(at);
  for (int n = 0;; ++n) {
    const fs::path file = fs::path(backupRoot_) /
        (n == 0 ? stem + ".json" : stem + "_" + std::to_string(n) + ".json");
    if (!write_new_file(file, body)) continue;
    spdlog::info("Backup created: {}", file.filename().string());
    return file.string();
  }
}

std::string LocalFSBackend::writeExport(const std::vector<Record>& records, int64_t at) const {
  const fs::path file(exportPath_);
  if (file.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    if (ec) throw IoError("cannot create export directory " + file.parent_path().string() + ": " + ec.message());
  }

  write_file(file, render_export(records, at, file.filename().string()));
  spdlog::info("Data exported to {}", file.string());
  return file.string();
}

} // namespace vault
