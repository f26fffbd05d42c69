#include "RecordQuery.hpp"

#include <algorithm>
#include <cctype>

#include "core/record/RecordId.hpp"
#include "core/record/VaultError.hpp"
#include "core/store/RecordStore.hpp"

namespace vault {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

SearchMode parseSearchMode(const std::string& s) {
  const auto v = lower(trim(s));
  if (v == "1" || v == "name" || v == "byname") return SearchMode::ByName;
  if (v == "2" || v == "id" || v == "byid") return SearchMode::ById;
  throw InvalidSelectionError("Invalid choice.");
}

SortField parseSortField(const std::string& s) {
  const auto v = lower(trim(s));
  if (v == "1" || v == "name") return SortField::Name;
  if (v == "2" || v == "createdat") return SortField::CreatedAt;
  throw InvalidSelectionError("Invalid selection.");
}

SortDirection parseSortDirection(const std::string& s) {
  const auto v = lower(trim(s));
  if (v == "1" || v == "asc" || v == "ascending") return SortDirection::Ascending;
  if (v == "2" || v == "desc" || v == "descending") return SortDirection::Descending;
  throw InvalidSelectionError("Invalid selection.");
}

std::vector<Record> RecordQuery::byName(const std::string& term) {
  const auto t = trim(term);
  if (t.empty()) throw ValidationError("Search term is required.");
  RecordFilter filter;
  filter.name_contains = t;
  return store_.find(filter, RecordOrder::creation());
}

std::vector<Record> RecordQuery::byId(const std::string& id) {
  const auto t = trim(id);
  if (t.empty()) throw ValidationError("ID is required.");
  if (!is_valid_record_id(t)) throw InvalidIdError(t);
  try {
    return {store_.findById(t)};
  } catch (const NotFoundError&) {
    return {};
  }
}

std::vector<Record> RecordQuery::search(SearchMode mode, const std::string& term) {
  return mode == SearchMode::ByName ? byName(term) : byId(term);
}

std::vector<Record> RecordQuery::sorted(SortField field, SortDirection direction) {
  return store_.listAll(RecordOrder{field, direction});
}

std::vector<Record> RecordQuery::all() {
  return store_.listAll();
}

} // namespace vault
