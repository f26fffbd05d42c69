#include "SqliteRecordStore.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <unicode/ucasemap.h>
#include <unicode/utypes.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "core/format/RecordFormat.hpp"
#include "core/record/RecordId.hpp"
#include "core/record/VaultError.hpp"

namespace vault {

namespace {

constexpr const char* kColumns = "id, name, details, created_at, updated_at";

// Owns one prepared statement.
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      throw StoreError("prepare failed: " + std::string(sqlite3_errmsg(db)));
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int i, const std::string& v) {
    check(sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT));
  }
  void bind(int i, int64_t v) {
    check(sqlite3_bind_int64(st_, i, v));
  }

  // true while a row is available.
  bool step() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError("step failed: " + std::string(sqlite3_errmsg(db_)));
  }

  std::string text(int col) const {
    const auto* p = sqlite3_column_text(st_, col);
    return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
  }
  int64_t int64(int col) const { return sqlite3_column_int64(st_, col); }

  Record record() const {
    Record r;
    r.id         = text(0);
    r.name       = text(1);
    r.details    = text(2);
    r.created_at = int64(3);
    r.updated_at = int64(4);
    return r;
  }

private:
  void check(int rc) {
    if (rc != SQLITE_OK) throw StoreError("bind failed: " + std::string(sqlite3_errmsg(db_)));
  }

  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

// Write transaction; rolls back unless committed.
class WriteTransaction {
public:
  explicit WriteTransaction(sqlite3* db) : db_(db) { run("BEGIN IMMEDIATE;"); }
  ~WriteTransaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() { run("COMMIT;"); done_ = true; }

private:
  void run(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
      std::string msg = err ? err : "unknown error";
      sqlite3_free(err);
      throw StoreError(std::string(sql) + " failed: " + msg);
    }
  }

  sqlite3* db_;
  bool done_ = false;
};

std::string order_clause(const RecordOrder& order) {
  const bool asc = order.direction == SortDirection::Ascending;
  switch (order.field) {
    case SortField::Name:
      return asc ? "name ASC, created_at ASC, seq ASC"
                 : "name DESC, created_at ASC, seq ASC";
    case SortField::UpdatedAt:
      return asc ? "updated_at ASC, seq ASC" : "updated_at DESC, seq DESC";
    case SortField::CreatedAt:
      break;
  }
  return asc ? "created_at ASC, seq ASC" : "created_at DESC, seq DESC";
}

// LIKE pattern matching `term` literally anywhere in the value.
std::string like_pattern(const std::string& term) {
  std::string out = "%";
  for (char c : term) {
    if (c == '%' || c == '_' || c == '\\') out += '\\';
    out += c;
  }
  out += '%';
  return out;
}

// fold(text): Unicode default case folding of a UTF-8 value. User data is
// the connection's UCaseMap.
void sql_fold(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
  if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
    sqlite3_result_null(ctx);
    return;
  }
  const auto* src = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
  const int len = sqlite3_value_bytes(argv[0]);
  const auto* csm = static_cast<const UCaseMap*>(sqlite3_user_data(ctx));

  std::string out(static_cast<std::size_t>(len) + 16, '\0');
  UErrorCode err = U_ZERO_ERROR;
  int32_t n = ucasemap_utf8FoldCase(csm, out.data(), static_cast<int32_t>(out.size()),
                                    src, len, &err);
  if (err == U_BUFFER_OVERFLOW_ERROR) {
    out.resize(static_cast<std::size_t>(n));
    err = U_ZERO_ERROR;
    n = ucasemap_utf8FoldCase(csm, out.data(), n, src, len, &err);
  }
  if (U_FAILURE(err)) {
    sqlite3_result_error(ctx, u_errorName(err), -1);
    return;
  }
  sqlite3_result_text(ctx, out.data(), n, SQLITE_TRANSIENT);
}

void close_case_map(void* p) {
  ucasemap_close(static_cast<UCaseMap*>(p));
}

// Registers fold() on the connection; the case map is released with it.
void register_fold(sqlite3* db) {
  UErrorCode err = U_ZERO_ERROR;
  UCaseMap* csm = ucasemap_open("", U_FOLD_CASE_DEFAULT, &err);
  if (U_FAILURE(err)) {
    throw StoreError(std::string("ucasemap_open failed: ") + u_errorName(err));
  }
  // close_case_map runs on failure too.
  const int rc = sqlite3_create_function_v2(db, "fold", 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                            csm, sql_fold, nullptr, nullptr, close_case_map);
  if (rc != SQLITE_OK) {
    throw StoreError("cannot register fold(): " + std::string(sqlite3_errmsg(db)));
  }
}

std::string checked_id(const std::string& id) {
  if (!is_valid_record_id(id)) throw InvalidIdError(id);
  return normalize_record_id(id);
}

} // namespace

SqliteRecordStore::SqliteRecordStore(const ConnectOptions& options) : db_(nullptr) {
  if (options.uri.empty()) throw StoreUnavailable("store URI is empty");

  if (!options.tls_cert_path.empty()) {
    const auto cert = std::filesystem::absolute(options.tls_cert_path);
    std::ifstream in(cert);
    if (!in) throw StoreUnavailable("cannot read TLS certificate: " + cert.string());
    spdlog::warn("TLS certificate {} ignored: SQLite store has no network transport", cert.string());
  }

  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(options.uri.c_str(), &db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    throw StoreUnavailable("failed to open store '" + options.uri + "': " + msg);
  }
  db_ = db;
  sqlite3_busy_timeout(db, options.timeout_ms);

  try {
    register_fold(db);
    Statement probe(db, "SELECT COUNT(*) FROM records;");
    probe.step();
  } catch (const StoreError& e) {
    close();
    throw StoreUnavailable("store '" + options.uri + "' is not usable (run --init): " + e.what());
  }
  spdlog::info("Connected to store {}", options.uri);
}

SqliteRecordStore::~SqliteRecordStore() {
  close();
}

void SqliteRecordStore::close() {
  if (!db_) return;
  sqlite3_close(static_cast<sqlite3*>(db_));
  db_ = nullptr;
  spdlog::info("Store connection closed");
}

void SqliteRecordStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(db_), sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StoreError(std::string(sql) + " failed: " + msg);
  }
}

std::optional<Record> SqliteRecordStore::selectById(const std::string& id) {
  Statement st(static_cast<sqlite3*>(db_),
               std::string("SELECT ") + kColumns + " FROM records WHERE id = ?;");
  st.bind(1, id);
  if (!st.step()) return std::nullopt;
  return st.record();
}

Record SqliteRecordStore::create(const std::string& name, const std::string& details) {
  Record r;
  r.name = trim(name);
  if (r.name.empty()) throw ValidationError("Name is required.");
  r.details    = trim(details);
  r.id         = generate_record_id();
  r.created_at = now_ms();
  r.updated_at = r.created_at;

  auto* db = static_cast<sqlite3*>(db_);
  Statement st(db, R"SQL(
    INSERT INTO records (id, name, details, created_at, updated_at)
    VALUES (?,?,?,?,?)
  )SQL");
  int i = 1;
  st.bind(i++, r.id);
  st.bind(i++, r.name);
  st.bind(i++, r.details);
  st.bind(i++, r.created_at);
  st.bind(i++, r.updated_at);
  st.step();

  spdlog::info("Record {} created", r.id);
  return r;
}

Record SqliteRecordStore::findById(const std::string& id) {
  const std::string key = checked_id(id);
  auto r = selectById(key);
  if (!r) throw NotFoundError(key);
  return *r;
}

Record SqliteRecordStore::update(const std::string& id, const RecordPatch& patch) {
  const std::string key = checked_id(id);
  const std::string name = trim(patch.name);
  const std::string details = trim(patch.details);

  auto* db = static_cast<sqlite3*>(db_);
  WriteTransaction tx(db);
  auto current = selectById(key);
  if (!current) throw NotFoundError(key);

  Record next = *current;
  if (!name.empty()) next.name = name;
  if (!details.empty()) next.details = details;
  if (next.name == current->name && next.details == current->details) {
    tx.commit();
    return next;
  }
  // Never move updated_at backwards, even if the wall clock does.
  next.updated_at = std::max(now_ms(), current->updated_at);

  Statement st(db, "UPDATE records SET name = ?, details = ?, updated_at = ? WHERE id = ?;");
  st.bind(1, next.name);
  st.bind(2, next.details);
  st.bind(3, next.updated_at);
  st.bind(4, key);
  st.step();
  tx.commit();

  spdlog::info("Record {} updated", key);
  return next;
}

Record SqliteRecordStore::remove(const std::string& id) {
  const std::string key = checked_id(id);

  auto* db = static_cast<sqlite3*>(db_);
  WriteTransaction tx(db);
  auto current = selectById(key);
  if (!current) throw NotFoundError(key);

  Statement st(db, "DELETE FROM records WHERE id = ?;");
  st.bind(1, key);
  st.step();
  tx.commit();

  spdlog::info("Record {} deleted", key);
  return *current;
}

std::vector<Record> SqliteRecordStore::find(const RecordFilter& filter, const RecordOrder& order) {
  std::string sql = std::string("SELECT ") + kColumns + " FROM records";
  // Both sides folded, so case is ignored beyond ASCII.
  if (filter.name_contains) sql += " WHERE fold(name) LIKE fold(?) ESCAPE '\\'";
  sql += " ORDER BY " + order_clause(order) + ";";

  Statement st(static_cast<sqlite3*>(db_), sql);
  if (filter.name_contains) st.bind(1, like_pattern(*filter.name_contains));

  std::vector<Record> out;
  while (st.step()) out.push_back(st.record());
  return out;
}

std::optional<Record> SqliteRecordStore::findFirst(const RecordOrder& order) {
  Statement st(static_cast<sqlite3*>(db_),
               std::string("SELECT ") + kColumns + " FROM records ORDER BY " +
               order_clause(order) + " LIMIT 1;");
  if (!st.step()) return std::nullopt;
  return st.record();
}

std::optional<LongestName> SqliteRecordStore::longestName() {
  // length() on TEXT counts characters, not bytes.
  Statement st(static_cast<sqlite3*>(db_),
               std::string("SELECT ") + kColumns + ", length(name) AS len FROM records"
               " ORDER BY len DESC, created_at ASC, seq ASC LIMIT 1;");
  if (!st.step()) return std::nullopt;
  LongestName out;
  out.record = st.record();
  out.length = static_cast<std::size_t>(st.int64(5));
  return out;
}

int64_t SqliteRecordStore::count() {
  Statement st(static_cast<sqlite3*>(db_), "SELECT COUNT(*) FROM records;");
  st.step();
  return st.int64(0);
}

void SqliteRecordStore::readSnapshot(const std::function<void()>& fn) {
  if (snapshot_depth_ > 0) { fn(); return; }

  exec("BEGIN;");
  ++snapshot_depth_;
  try {
    fn();
  } catch (...) {
    --snapshot_depth_;
    sqlite3_exec(static_cast<sqlite3*>(db_), "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
  --snapshot_depth_;
  exec("COMMIT;");
}

} // namespace vault
