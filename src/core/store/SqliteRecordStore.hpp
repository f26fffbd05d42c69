#pragma once
#include "core/store/RecordStore.hpp"

namespace vault {

class SqliteRecordStore : public RecordStore {
public:
  // Opens the connection. Throws StoreUnavailable on failure.
  explicit SqliteRecordStore(const ConnectOptions& options);
  ~SqliteRecordStore() override;

  SqliteRecordStore(const SqliteRecordStore&) = delete;
  SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

  Record create(const std::string& name, const std::string& details) override;
  Record findById(const std::string& id) override;
  Record update(const std::string& id, const RecordPatch& patch) override;
  Record remove(const std::string& id) override;

  std::vector<Record> find(const RecordFilter& filter, const RecordOrder& order) override;
  std::optional<Record> findFirst(const RecordOrder& order) override;
  std::optional<LongestName> longestName() override;
  int64_t count() override;

  void readSnapshot(const std::function<void()>& fn) override;

  // Closes the connection; safe to call more than once.
  void close();

private:
  std::optional<Record> selectById(const std::string& id);
  void exec(const char* sql);

  void* db_;  // sqlite3*
  int snapshot_depth_ = 0;
};

} // namespace vault
