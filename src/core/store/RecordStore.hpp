#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/record/Record.hpp"

namespace vault {

struct ConnectOptions {
  std::string uri;            // database filename or SQLite "file:" URI
  std::string tls_cert_path;  // optional client certificate
  int         timeout_ms = 5000;
};

struct LongestName {
  Record      record;
  std::size_t length = 0;  // code points
};

// Persistent collection of Records. The only component that mutates
// persistent state. Ids and timestamps are assigned here.
//
// Malformed ids throw InvalidIdError before any query is made; unknown
// ids throw NotFoundError; SQL failures throw StoreError.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  virtual Record create(const std::string& name, const std::string& details) = 0;
  virtual Record findById(const std::string& id) = 0;
  virtual Record update(const std::string& id, const RecordPatch& patch) = 0;
  virtual Record remove(const std::string& id) = 0;

  virtual std::vector<Record> find(const RecordFilter& filter, const RecordOrder& order) = 0;
  virtual std::optional<Record> findFirst(const RecordOrder& order) = 0;
  virtual std::optional<LongestName> longestName() = 0;
  virtual int64_t count() = 0;

  // Runs fn against a single read view of the collection.
  virtual void readSnapshot(const std::function<void()>& fn) = 0;

  std::vector<Record> listAll(const RecordOrder& order = RecordOrder::creation()) {
    return find(RecordFilter{}, order);
  }
};

} // namespace vault
