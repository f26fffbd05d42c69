#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "TestVault.hpp"
#include "core/stats/VaultStatistics.hpp"

using namespace vault;

TEST_F(StoreTest, StatisticsOnEmptyVaultUseSentinels) {
  const auto s = collectStatistics(*store_);

  EXPECT_EQ(s.total, 0);
  EXPECT_FALSE(s.last_modified);
  EXPECT_FALSE(s.earliest_created);
  EXPECT_FALSE(s.latest_created);
  EXPECT_FALSE(s.longest_name);
  EXPECT_EQ(s.longest_name_length, 0u);

  const auto text = renderStatistics(s);
  EXPECT_NE(text.find("Total Records: 0\n"), std::string::npos);
  EXPECT_NE(text.find("Last Modification: N/A\n"), std::string::npos);
  EXPECT_NE(text.find("Longest Name: N/A (0 characters)\n"), std::string::npos);
  EXPECT_NE(text.find("Earliest Record Date: N/A\n"), std::string::npos);
  EXPECT_NE(text.find("Latest Record Date: N/A\n"), std::string::npos);
}

TEST_F(StoreTest, LongestNameCountsCodePointsNotBytes) {
  store_->create("abcdefgh", "");                                // 8 code points, 8 bytes
  store_->create("\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E", "");    // 3 code points, 9 bytes
  store_->create("xyz", "");

  const auto s = collectStatistics(*store_);
  ASSERT_TRUE(s.longest_name);
  EXPECT_EQ(*s.longest_name, "abcdefgh");
  EXPECT_EQ(s.longest_name_length, 8u);
}

TEST_F(StoreTest, LongestNameTieGoesToEarliestRecord) {
  store_->create("bravo", "");
  store_->create("alpha", "");
  store_->create("delta", "");

  const auto s = collectStatistics(*store_);
  EXPECT_EQ(s.longest_name.value_or(""), "bravo");
  EXPECT_EQ(s.longest_name_length, 5u);
}

TEST_F(StoreTest, StatisticsTrackCreationAndModification) {
  const auto a = store_->create("a", "");
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  store_->create("b", "");
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  const auto c = store_->create("c", "");
  std::this_thread::sleep_for(std::chrono::milliseconds(3));
  const auto a2 = store_->update(a.id, RecordPatch{"a2", ""});

  const auto s = collectStatistics(*store_);
  EXPECT_EQ(s.total, 3);
  EXPECT_EQ(s.earliest_created, a.created_at);
  EXPECT_EQ(s.latest_created, c.created_at);
  EXPECT_EQ(s.last_modified, a2.updated_at);

  store_->remove(a.id);
  store_->remove(c.id);
  const auto after = collectStatistics(*store_);
  EXPECT_EQ(after.total, 1);
  EXPECT_EQ(after.earliest_created, after.latest_created);
  EXPECT_EQ(after.longest_name.value_or(""), "b");
}
