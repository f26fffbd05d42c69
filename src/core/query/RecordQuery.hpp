#pragma once
#include <string>
#include <vector>

#include "core/record/Record.hpp"

namespace vault {

class RecordStore;

enum class SearchMode { ByName, ById };

// Selection parsing for the search / sort menus. Accepts the menu digit or
// the field name, case-insensitively; throws InvalidSelectionError otherwise.
SearchMode    parseSearchMode(const std::string& s);
SortField     parseSortField(const std::string& s);
SortDirection parseSortDirection(const std::string& s);

class RecordQuery {
public:
  explicit RecordQuery(RecordStore& store) : store_(store) {}

  // Case-insensitive substring match on name, creation order.
  // Empty term throws ValidationError.
  std::vector<Record> byName(const std::string& term);

  // Zero or one record. Malformed id throws InvalidIdError.
  std::vector<Record> byId(const std::string& id);

  std::vector<Record> search(SearchMode mode, const std::string& term);
  std::vector<Record> sorted(SortField field, SortDirection direction);
  std::vector<Record> all();

private:
  RecordStore& store_;
};

} // namespace vault
