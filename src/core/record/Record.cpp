#include "Record.hpp"

#include <nlohmann/json.hpp>

#include "core/format/RecordFormat.hpp"
#include "core/record/RecordId.hpp"
#include "core/record/VaultError.hpp"

namespace vault {

std::string trim(const std::string& s) {
  const char* ws = " \t\n\r\f\v";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::size_t utf8_length(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;  // skip continuation bytes
  }
  return n;
}

void to_json(nlohmann::json& j, const Record& r) {
  j = nlohmann::json{
    {"id",        r.id},
    {"name",      r.name},
    {"details",   r.details},
    {"createdAt", format_iso_utc(r.created_at)},
    {"updatedAt", format_iso_utc(r.updated_at)}
  };
}

void from_json(const nlohmann::json& j, Record& r) {
  if (!j.is_object()) throw ValidationError("record document must be a JSON object");

  auto get_s = [&](const char* k, bool required) -> std::string {
    if (!j.contains(k)) {
      if (required) throw ValidationError(std::string("record document missing '") + k + "'");
      return {};
    }
    if (!j[k].is_string()) throw ValidationError(std::string("record field '") + k + "' must be a string");
    return j[k].get<std::string>();
  };
  auto get_ts = [&](const char* k) -> int64_t {
    const auto v = parse_iso_utc(get_s(k, true));
    if (!v) throw ValidationError(std::string("record field '") + k + "' is not an ISO-8601 timestamp");
    return *v;
  };

  Record out;
  out.id = get_s("id", true);
  if (!is_valid_record_id(out.id)) throw ValidationError("record document has malformed id '" + out.id + "'");
  out.id = normalize_record_id(out.id);

  out.name = trim(get_s("name", true));
  if (out.name.empty()) throw ValidationError("record name must not be empty");

  out.details    = trim(get_s("details", false));
  out.created_at = get_ts("createdAt");
  out.updated_at = get_ts("updatedAt");
  if (out.created_at > out.updated_at) {
    throw ValidationError("record updatedAt precedes createdAt");
  }
  r = std::move(out);
}

} // namespace vault
