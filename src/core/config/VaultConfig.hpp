#pragma once
#include <string>

#include <spdlog/common.h>

#include "core/store/RecordStore.hpp"

namespace vault {

struct VaultConfig {
  ConnectOptions store;
  std::string    backupDir  = "backups";
  std::string    exportPath = "export.txt";
  std::string    schemaPath;   // empty = search the usual places
  int            port       = 8080;
  std::string    apiKey;       // empty = auth disabled
  std::string    logLevel   = "info";
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads KEY=VALUE lines into the environment without overriding variables
// that are already set. Returns the number of variables it set; a missing
// file is not an error.
int loadDotEnv(const std::string& path);

// Builds the config from the environment. Throws ConfigError when
// VAULT_DB_URI is missing.
VaultConfig loadConfig();

// Maps a VAULT_LOG_LEVEL name to a spdlog level. An unknown name logs a
// warning and gives info; only "off" turns logging off.
spdlog::level::level_enum parseLogLevel(const std::string& name);

// VAULT_SCHEMA_PATH / config value first, then CWD, then the source tree.
// Throws ConfigError if none exists.
std::string findSchemaPath(const VaultConfig& cfg);

} // namespace vault
