#include "VaultStatistics.hpp"

#include <sstream>

#include "core/format/RecordFormat.hpp"
#include "core/store/RecordStore.hpp"

namespace vault {

namespace {

std::string or_na(const std::optional<int64_t>& ms) {
  return ms ? format_local(*ms) : std::string(kNotAvailable);
}

} // namespace

VaultStats collectStatistics(RecordStore& store) {
  VaultStats s;
  store.readSnapshot([&] {
    s.total = store.count();
    if (auto r = store.findFirst({SortField::UpdatedAt, SortDirection::Descending}))
      s.last_modified = r->updated_at;
    if (auto r = store.findFirst({SortField::CreatedAt, SortDirection::Ascending}))
      s.earliest_created = r->created_at;
    if (auto r = store.findFirst({SortField::CreatedAt, SortDirection::Descending}))
      s.latest_created = r->created_at;
    if (auto l = store.longestName()) {
      s.longest_name = l->record.name;
      s.longest_name_length = l->length;
    }
  });
  return s;
}

std::string renderStatistics(const VaultStats& stats) {
  std::ostringstream oss;
  oss << "==== Vault Statistics ====\n"
      << "Total Records: " << stats.total << "\n"
      << "Last Modification: " << or_na(stats.last_modified) << "\n"
      << "Longest Name: " << stats.longest_name.value_or(kNotAvailable)
      << " (" << stats.longest_name_length << " characters)\n"
      << "Earliest Record Date: " << or_na(stats.earliest_created) << "\n"
      << "Latest Record Date: " << or_na(stats.latest_created) << "\n";
  return oss.str();
}

} // namespace vault
