#pragma once
#include <string>

namespace vault {

// Creates the database if needed and applies schema.sql. Idempotent.
// Throws StoreUnavailable on failure.
bool initDatabase(const std::string& dbUri, const std::string& schemaPath);

} // namespace vault
