#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "TestVault.hpp"
#include "core/record/RecordId.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/vault/VaultController.hpp"

using namespace vault;

namespace {

std::vector<fs::path> backups_in(const fs::path& dir) {
  std::vector<fs::path> out;
  if (!fs::exists(dir)) return out;
  for (const auto& e : fs::directory_iterator(dir)) out.push_back(e.path());
  return out;
}

nlohmann::json read_json(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return nlohmann::json::parse(buf.str());
}

} // namespace

class VaultControllerTest : public StoreTest {
protected:
  void SetUp() override {
    StoreTest::SetUp();
    backupDir_ = dir_ / "backups";
    files_ = std::make_unique<LocalFSBackend>(backupDir_.string(), (dir_ / "export.txt").string());
    files_->ensureBackupDir();
    vault_ = std::make_unique<VaultController>(*store_, *files_);
  }

  std::size_t backupCount() const { return backups_in(backupDir_).size(); }

  fs::path backupDir_;
  std::unique_ptr<LocalFSBackend> files_;
  std::unique_ptr<VaultController> vault_;
};

TEST_F(VaultControllerTest, AddWritesOneFullBackup) {
  vault_->addRecord("Passport", "");
  const auto r = vault_->addRecord("Router", "Home WiFi");

  ASSERT_TRUE(r.ok()) << r.message;
  ASSERT_EQ(r.records.size(), 1u);
  EXPECT_EQ(r.records[0].name, "Router");
  EXPECT_EQ(backupCount(), 2u);

  const auto snapshot = read_json(r.artifact).get<std::vector<Record>>();
  EXPECT_EQ(snapshot, store_->listAll());
  EXPECT_EQ(snapshot.size(), 2u);
}

TEST_F(VaultControllerTest, AddRejectsBlankName) {
  const auto r = vault_->addRecord("   ", "details");

  EXPECT_EQ(r.error, ErrorKind::Validation);
  EXPECT_TRUE(r.records.empty());
  EXPECT_EQ(store_->count(), 0);
  EXPECT_EQ(backupCount(), 0u);
}

TEST_F(VaultControllerTest, UpdateWritesNoBackup) {
  const auto added = vault_->addRecord("Old", "");
  const auto before = backupCount();

  const auto r = vault_->updateRecord(added.records[0].id, "New", "");
  ASSERT_TRUE(r.ok()) << r.message;
  EXPECT_EQ(r.records[0].name, "New");
  EXPECT_TRUE(r.artifact.empty());
  EXPECT_EQ(backupCount(), before);
}

TEST_F(VaultControllerTest, UpdateReportsBadIds) {
  EXPECT_EQ(vault_->updateRecord("bogus", "New", "").error, ErrorKind::InvalidId);
  EXPECT_EQ(vault_->updateRecord(generate_record_id(), "New", "").error, ErrorKind::NotFound);
}

TEST_F(VaultControllerTest, DeleteNeedsConfirmation) {
  const auto id = vault_->addRecord("Router", "").records[0].id;
  const auto before = backupCount();

  const auto r = vault_->deleteRecord(id, false);
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.message, "Delete operation cancelled.");
  EXPECT_EQ(store_->count(), 1);
  EXPECT_EQ(backupCount(), before);
}

TEST_F(VaultControllerTest, DeleteWritesOneBackup) {
  const auto keep = vault_->addRecord("Passport", "").records[0];
  const auto gone = vault_->addRecord("Router", "").records[0];
  const auto before = backupCount();

  const auto r = vault_->deleteRecord(gone.id, true);
  ASSERT_TRUE(r.ok()) << r.message;
  EXPECT_EQ(backupCount(), before + 1);
  EXPECT_EQ(read_json(r.artifact).get<std::vector<Record>>(), std::vector<Record>{keep});
}

TEST_F(VaultControllerTest, DeleteFailuresWriteNoBackup) {
  vault_->addRecord("Router", "");
  const auto before = backupCount();

  EXPECT_EQ(vault_->deleteRecord("bogus", true).error, ErrorKind::InvalidId);
  EXPECT_EQ(vault_->deleteRecord(generate_record_id(), true).error, ErrorKind::NotFound);
  EXPECT_EQ(backupCount(), before);
  EXPECT_EQ(store_->count(), 1);
}

TEST_F(VaultControllerTest, RouterScenarioEndToEnd) {
  const auto added = vault_->addRecord("Router", "Home WiFi");
  ASSERT_TRUE(added.ok());
  const auto id = added.records[0].id;

  auto listed = vault_->listRecords();
  ASSERT_EQ(listed.records.size(), 1u);
  EXPECT_EQ(listed.records[0].details, "Home WiFi");

  const auto deleted = vault_->deleteRecord(id, true);
  ASSERT_TRUE(deleted.ok());

  listed = vault_->listRecords();
  EXPECT_TRUE(listed.records.empty());
  EXPECT_EQ(listed.message, "No records available.");

  ASSERT_TRUE(fs::exists(deleted.artifact));
  EXPECT_TRUE(read_json(deleted.artifact).empty());
}

TEST_F(VaultControllerTest, BackupFailureKeepsRecordCommitted) {
  std::ofstream(dir_ / "blocked") << "not a directory";
  LocalFSBackend blocked((dir_ / "blocked/backups").string(), (dir_ / "export.txt").string());
  VaultController vault(*store_, blocked);

  const auto r = vault.addRecord("Router", "Home WiFi");
  EXPECT_EQ(r.error, ErrorKind::IoFailure);
  ASSERT_EQ(r.records.size(), 1u);
  EXPECT_TRUE(r.artifact.empty());
  EXPECT_EQ(store_->findById(r.records[0].id), r.records[0]);

  const auto d = vault.deleteRecord(r.records[0].id, true);
  EXPECT_EQ(d.error, ErrorKind::IoFailure);
  EXPECT_EQ(store_->count(), 0);
}

TEST_F(VaultControllerTest, SearchAndSortRejectBadSelections) {
  vault_->addRecord("Passport", "");

  EXPECT_EQ(vault_->searchRecords("3", "pass").error, ErrorKind::InvalidSelection);
  EXPECT_EQ(vault_->searchRecords("1", "  ").error, ErrorKind::Validation);
  EXPECT_EQ(vault_->sortRecords("size", "1").error, ErrorKind::InvalidSelection);
  EXPECT_EQ(vault_->sortRecords("1", "sideways").error, ErrorKind::InvalidSelection);
}

TEST_F(VaultControllerTest, SearchById) {
  const auto id = vault_->addRecord("Passport", "").records[0].id;

  const auto hit = vault_->searchRecords("2", id);
  ASSERT_TRUE(hit.ok());
  EXPECT_EQ(hit.records.size(), 1u);

  const auto miss = vault_->searchRecords("2", generate_record_id());
  EXPECT_TRUE(miss.ok());
  EXPECT_TRUE(miss.records.empty());
  EXPECT_EQ(miss.message, "No records found.");

  const auto bad = vault_->searchRecords("2", "12345");
  EXPECT_EQ(bad.error, ErrorKind::InvalidId);
  EXPECT_EQ(bad.message, "Invalid ID format.");
}

TEST_F(VaultControllerTest, SortRecords) {
  vault_->addRecord("bravo", "");
  vault_->addRecord("alpha", "");

  const auto r = vault_->sortRecords("name", "desc");
  ASSERT_TRUE(r.ok());
  ASSERT_EQ(r.records.size(), 2u);
  EXPECT_EQ(r.records[0].name, "bravo");

  const auto asc = vault_->sortRecords("1", "1");
  ASSERT_EQ(asc.records.size(), 2u);
  EXPECT_EQ(asc.records[0].name, "alpha");
}

TEST_F(VaultControllerTest, ExportOverwritesReport) {
  vault_->addRecord("Router", "");
  const auto first = vault_->exportData();
  vault_->addRecord("Passport", "");
  const auto second = vault_->exportData();

  ASSERT_TRUE(second.ok()) << second.message;
  EXPECT_EQ(first.artifact, second.artifact);
  EXPECT_EQ(second.message, "Data exported successfully to export.txt.");

  std::ifstream in(second.artifact);
  std::ostringstream buf;
  buf << in.rdbuf();
  EXPECT_NE(buf.str().find("Total Records: 2\n"), std::string::npos);
}

TEST_F(VaultControllerTest, ViewStatistics) {
  vault_->addRecord("Passport", "");
  const auto r = vault_->viewStatistics();

  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(r.stats);
  EXPECT_EQ(r.stats->total, 1);
  EXPECT_NE(r.message.find("Longest Name: Passport (8 characters)"), std::string::npos);
}

// Store whose every call fails, to check errors never escape the controller.
class FailingStore : public RecordStore {
public:
  Record create(const std::string&, const std::string&) override { fail(); }
  Record findById(const std::string&) override { fail(); }
  Record update(const std::string&, const RecordPatch&) override { fail(); }
  Record remove(const std::string&) override { fail(); }
  std::vector<Record> find(const RecordFilter&, const RecordOrder&) override { fail(); }
  std::optional<Record> findFirst(const RecordOrder&) override { fail(); }
  std::optional<LongestName> longestName() override { fail(); }
  int64_t count() override { throw std::runtime_error("connection reset"); }
  void readSnapshot(const std::function<void()>& fn) override { fn(); }

private:
  [[noreturn]] static void fail() { throw StoreError("database is locked"); }
};

TEST(VaultControllerFailures, StoreErrorsBecomeResults) {
  ScratchDir dir;
  FailingStore store;
  LocalFSBackend files((dir / "backups").string(), (dir / "export.txt").string());
  VaultController vault(store, files);

  EXPECT_EQ(vault.addRecord("Router", "").error, ErrorKind::StoreFailure);
  EXPECT_EQ(vault.listRecords().error, ErrorKind::StoreFailure);
  EXPECT_EQ(vault.searchRecords("name", "r").error, ErrorKind::StoreFailure);
  EXPECT_EQ(vault.exportData().error, ErrorKind::StoreFailure);

  const auto stats = vault.viewStatistics();
  EXPECT_EQ(stats.error, ErrorKind::StoreFailure);
  EXPECT_NE(stats.message.find("connection reset"), std::string::npos);

  // Validation still happens before the store is touched.
  EXPECT_EQ(vault.deleteRecord("bogus", true).error, ErrorKind::InvalidId);
  EXPECT_TRUE(vault.deleteRecord(generate_record_id(), false).ok());
}
