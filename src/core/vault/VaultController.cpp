#include "VaultController.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <utility>

#include "core/format/RecordFormat.hpp"
#include "core/record/RecordId.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/RecordStore.hpp"

namespace vault {

namespace {

OpResult failure(ErrorKind kind, std::string message) {
  OpResult r;
  r.error = kind;
  r.message = std::move(message);
  return r;
}

std::string message_for(const VaultError& e) {
  switch (e.kind()) {
    case ErrorKind::InvalidId: return "Invalid ID format.";
    case ErrorKind::NotFound:  return "Record not found.";
    default:                   return e.what();
  }
}

// Id check done up front so no store call is made for a malformed id.
std::string require_id(const std::string& raw) {
  const auto id = trim(raw);
  if (!is_valid_record_id(id)) throw InvalidIdError(id);
  return id;
}

} // namespace

template <typename Fn>
OpResult VaultController::guarded(const char* op, Fn&& fn) {
  try {
    return fn();
  } catch (const VaultError& e) {
    if (e.kind() == ErrorKind::StoreFailure || e.kind() == ErrorKind::IoFailure)
      spdlog::error("{} failed: {}", op, e.what());
    else
      spdlog::warn("{} rejected: {}", op, e.what());
    return failure(e.kind(), message_for(e));
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", op, e.what());
    return failure(ErrorKind::StoreFailure, std::string("An error occurred: ") + e.what());
  }
}

std::string VaultController::backup() {
  return files_.writeBackup(store_.listAll(), now_ms());
}

OpResult VaultController::addRecord(const std::string& name, const std::string& details) {
  return guarded("add", [&] {
    const auto n = trim(name);
    if (n.empty()) throw ValidationError("Name is required. Aborting add operation.");

    OpResult r;
    r.records.push_back(store_.create(n, trim(details)));
    r.message = "Record added successfully.";
    try {
      r.artifact = backup();
    } catch (const std::exception& e) {
      spdlog::error("backup after add of {} failed: {}", r.records.front().id, e.what());
      r.error = ErrorKind::IoFailure;
      r.message = std::string("Record added, but backup failed: ") + e.what();
    }
    return r;
  });
}

OpResult VaultController::updateRecord(const std::string& id,
                                       const std::string& newName,
                                       const std::string& newDetails) {
  return guarded("update", [&] {
    const auto key = require_id(id);
    OpResult r;
    r.records.push_back(store_.update(key, RecordPatch{newName, newDetails}));
    r.message = "Record updated successfully.";
    return r;
  });
}

OpResult VaultController::deleteRecord(const std::string& id, bool confirmed) {
  return guarded("delete", [&] {
    const auto key = require_id(id);
    OpResult r;
    if (!confirmed) {
      r.message = "Delete operation cancelled.";
      return r;
    }

    r.records.push_back(store_.remove(key));
    r.message = "Record deleted successfully.";
    try {
      r.artifact = backup();
    } catch (const std::exception& e) {
      spdlog::error("backup after delete of {} failed: {}", key, e.what());
      r.error = ErrorKind::IoFailure;
      r.message = std::string("Record deleted, but backup failed: ") + e.what();
    }
    return r;
  });
}

OpResult VaultController::listRecords() {
  return guarded("list", [&] {
    OpResult r;
    r.records = query_.all();
    r.message = r.records.empty() ? "No records available." : "All Records:";
    return r;
  });
}

OpResult VaultController::searchRecords(const std::string& mode, const std::string& term) {
  return guarded("search", [&] {
    OpResult r;
    r.records = query_.search(parseSearchMode(mode), term);
    r.message = r.records.empty() ? "No records found." : "Search Results:";
    return r;
  });
}

OpResult VaultController::sortRecords(const std::string& field, const std::string& direction) {
  return guarded("sort", [&] {
    const auto f = parseSortField(field);
    const auto d = parseSortDirection(direction);
    OpResult r;
    r.records = query_.sorted(f, d);
    r.message = r.records.empty() ? "No records to sort." : "Sorted Records:";
    return r;
  });
}

OpResult VaultController::exportData() {
  return guarded("export", [&] {
    OpResult r;
    r.records = query_.all();
    r.artifact = files_.writeExport(r.records, now_ms());
    r.message = "Data exported successfully to " +
                std::filesystem::path(r.artifact).filename().string() + ".";
    return r;
  });
}

OpResult VaultController::viewStatistics() {
  return guarded("stats", [&] {
    OpResult r;
    r.stats = collectStatistics(store_);
    r.message = renderStatistics(*r.stats);
    return r;
  });
}

} // namespace vault
