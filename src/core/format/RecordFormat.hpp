#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/record/Record.hpp"

namespace vault {

constexpr const char* kNotAvailable = "N/A";

int64_t now_ms();

// "2026-10-19 08:15:02" in the process's local time zone.
std::string format_local(int64_t ms);

// "2026-10-19T08:15:02.123Z"
std::string format_iso_utc(int64_t ms);
std::optional<int64_t> parse_iso_utc(const std::string& s);

// "2026-10-19-08-15-02": ISO form truncated to seconds, ':' and 'T' replaced.
std::string backup_stamp(int64_t ms);

// Six-line display block:
//   #<index>  ID:  Name:  Details:  Created:  Updated:
std::string render_record(const Record& r, std::size_t index);

// Every block preceded by a blank line, as the menu shows them.
std::string render_records(const std::vector<Record>& records);

// Full export report: header, blank line, blank-line separated blocks.
std::string render_export(const std::vector<Record>& records,
                          int64_t exported_at,
                          const std::string& file_name);

} // namespace vault
