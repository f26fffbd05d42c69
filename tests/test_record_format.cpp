#include <gtest/gtest.h>

#include <algorithm>

#include "core/format/RecordFormat.hpp"

using namespace vault;

namespace {

Record sample(const std::string& id, const std::string& name, const std::string& details, int64_t at) {
  return Record{id, name, details, at, at + 1000};
}

} // namespace

TEST(RecordFormat, IsoUtcFormatting) {
  EXPECT_EQ(format_iso_utc(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(format_iso_utc(1700000000123), "2023-11-14T22:13:20.123Z");
}

TEST(RecordFormat, IsoUtcParsing) {
  EXPECT_EQ(parse_iso_utc("2023-11-14T22:13:20.123Z"), 1700000000123);
  EXPECT_EQ(parse_iso_utc("2023-11-14T22:13:20Z"), 1700000000000);
  EXPECT_EQ(parse_iso_utc("2023-11-14T22:13:20.5Z"), 1700000000500);

  EXPECT_FALSE(parse_iso_utc("2023-11-14 22:13:20"));
  EXPECT_FALSE(parse_iso_utc("2023-11-14T22:13:20.123"));
  EXPECT_FALSE(parse_iso_utc("2023-11-14T22:13:20.123Zjunk"));
  EXPECT_FALSE(parse_iso_utc("garbage"));
}

TEST(RecordFormat, BackupStampIsFilesystemSafe) {
  const auto stamp = backup_stamp(1700000000123);
  EXPECT_EQ(stamp, "2023-11-14-22-13-20");
  EXPECT_EQ(stamp.find(':'), std::string::npos);
  EXPECT_EQ(stamp.find('T'), std::string::npos);
}

TEST(RecordFormat, RecordBlockHasSixLines) {
  const auto r = sample("0123456789abcdef01234567", "Passport", "", 1700000000000);
  const auto block = render_record(r, 3);

  EXPECT_EQ(std::count(block.begin(), block.end(), '\n'), 5);
  EXPECT_EQ(block,
            "#3\n"
            "ID: 0123456789abcdef01234567\n"
            "Name: Passport\n"
            "Details: N/A\n"
            "Created: " + format_local(r.created_at) + "\n"
            "Updated: " + format_local(r.updated_at));
}

TEST(RecordFormat, ExportLayout) {
  const auto a = sample("0123456789abcdef01234567", "Router", "Home WiFi", 1700000000000);
  const auto b = sample("0123456789abcdef01234568", "Passport", "", 1700000001000);
  const auto now = 1700000100000;

  const auto text = render_export({a, b}, now, "export.txt");
  const std::string header =
      "Export Timestamp: " + format_local(now) + "\n"
      "Total Records: 2\n"
      "File: export.txt\n"
      "------------------------------\n"
      "\n";
  EXPECT_EQ(text, header + render_record(a, 1) + "\n\n" + render_record(b, 2) + "\n");
}

TEST(RecordFormat, EmptyExportIsHeaderOnly) {
  const auto text = render_export({}, 1700000100000, "export.txt");
  EXPECT_NE(text.find("Total Records: 0\n"), std::string::npos);
  EXPECT_EQ(text.substr(text.size() - 32), "------------------------------\n\n");
}
