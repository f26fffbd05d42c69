#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace vault {

class RecordStore;

struct VaultStats {
  int64_t                    total = 0;
  std::optional<int64_t>     last_modified;     // max updated_at
  std::optional<int64_t>     earliest_created;
  std::optional<int64_t>     latest_created;
  std::optional<std::string> longest_name;      // first in creation order on ties
  std::size_t                longest_name_length = 0;
};

// All facts come from one read snapshot of the store.
VaultStats collectStatistics(RecordStore& store);

// "==== Vault Statistics ====" block; empty facts print as N/A.
std::string renderStatistics(const VaultStats& stats);

} // namespace vault
