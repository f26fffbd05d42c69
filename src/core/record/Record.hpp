#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace vault {

struct Record {
  std::string id;
  std::string name;
  std::string details;   // empty = not provided, rendered as "N/A"
  int64_t     created_at = 0;  // ms since epoch, UTC
  int64_t     updated_at = 0;  // ms since epoch, UTC
};

inline bool operator==(const Record& a, const Record& b) {
  return a.id == b.id && a.name == b.name && a.details == b.details &&
         a.created_at == b.created_at && a.updated_at == b.updated_at;
}
inline bool operator!=(const Record& a, const Record& b) { return !(a == b); }

enum class SortField { Name, CreatedAt, UpdatedAt };
enum class SortDirection { Ascending, Descending };

struct RecordOrder {
  SortField     field     = SortField::CreatedAt;
  SortDirection direction = SortDirection::Ascending;

  // Natural enumeration order of the vault.
  static RecordOrder creation() { return {}; }
};

struct RecordFilter {
  std::optional<std::string> name_contains;  // case-insensitive substring
};

// Fields for update. Empty (after trim) means "leave as is".
struct RecordPatch {
  std::string name;
  std::string details;
};

// Strips ASCII whitespace from both ends.
std::string trim(const std::string& s);

// Number of UTF-8 code points; invalid lead bytes count as one each.
std::size_t utf8_length(const std::string& s);

// Explicit document mapping used for backups and the HTTP driver.
// from_json validates and throws ValidationError.
void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

} // namespace vault
