#include "RecordFormat.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vault {

namespace {

std::tm to_tm(int64_t ms, bool utc) {
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  if (ms < 0 && ms % 1000 != 0) --secs;
  std::tm tm{};
#ifdef _WIN32
  if (utc) gmtime_s(&tm, &secs); else localtime_s(&tm, &secs);
#else
  if (utc) gmtime_r(&secs, &tm); else localtime_r(&secs, &tm);
#endif
  return tm;
}

std::string put(const std::tm& tm, const char* fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

} // namespace

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_local(int64_t ms) {
  return put(to_tm(ms, false), "%Y-%m-%d %H:%M:%S");
}

std::string format_iso_utc(int64_t ms) {
  int64_t frac = ms % 1000;
  if (frac < 0) frac += 1000;
  char buf[8];
  std::snprintf(buf, sizeof(buf), ".%03dZ", static_cast<int>(frac));
  return put(to_tm(ms, true), "%Y-%m-%dT%H:%M:%S") + buf;
}

std::optional<int64_t> parse_iso_utc(const std::string& s) {
  std::tm tm{};
  std::istringstream in(s);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) return std::nullopt;

  int millis = 0;
  char c = 0;
  if (in.get(c) && c == '.') {
    int digits = 0;
    while (in.get(c) && c >= '0' && c <= '9') {
      if (digits < 3) millis = millis * 10 + (c - '0');
      ++digits;
    }
    if (digits == 0) return std::nullopt;
    for (; digits < 3; ++digits) millis *= 10;
  }
  if (c != 'Z') return std::nullopt;
  if (in.get(c)) return std::nullopt;  // trailing garbage

#ifdef _WIN32
  const std::time_t secs = _mkgmtime(&tm);
#else
  const std::time_t secs = timegm(&tm);
#endif
  if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
  return static_cast<int64_t>(secs) * 1000 + millis;
}

std::string backup_stamp(int64_t ms) {
  return put(to_tm(ms, true), "%Y-%m-%d-%H-%M-%S");
}

std::string render_record(const Record& r, std::size_t index) {
  std::ostringstream oss;
  oss << "#" << index << "\n"
      << "ID: " << r.id << "\n"
      << "Name: " << r.name << "\n"
      << "Details: " << (r.details.empty() ? kNotAvailable : r.details) << "\n"
      << "Created: " << format_local(r.created_at) << "\n"
      << "Updated: " << format_local(r.updated_at);
  return oss.str();
}

std::string render_records(const std::vector<Record>& records) {
  std::string out;
  for (std::size_t i = 0; i < records.size(); ++i) {
    out += "\n";
    out += render_record(records[i], i + 1);
    out += "\n";
  }
  return out;
}

std::string render_export(const std::vector<Record>& records,
                          int64_t exported_at,
                          const std::string& file_name) {
  std::string out;
  out += "Export Timestamp: " + format_local(exported_at) + "\n";
  out += "Total Records: " + std::to_string(records.size()) + "\n";
  out += "File: " + file_name + "\n";
  out += "------------------------------";
  out += "\n\n";
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (i > 0) out += "\n";
    out += render_record(records[i], i + 1);
    out += "\n";
  }
  return out;
}

} // namespace vault
