#pragma once
#include <string>

namespace vault {

// Record ids are 12 bytes rendered as 24 hex chars:
// 4-byte seconds timestamp | 5 random bytes (per process) | 3-byte counter.
constexpr std::size_t kRecordIdLength = 24;

std::string generate_record_id();

// Format check only. Says nothing about whether the record exists.
bool is_valid_record_id(const std::string& id);

// Lowercases a valid id so lookups are case-insensitive on hex digits.
std::string normalize_record_id(const std::string& id);

} // namespace vault
