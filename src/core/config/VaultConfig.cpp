#include "VaultConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

#include "core/record/Record.hpp"
#include "core/record/VaultError.hpp"

namespace vault {

namespace {

int env_int_or(const char* key, int defval) {
  const auto v = get_env_or(key, "");
  if (v.empty()) return defval;
  try {
    return std::stoi(v);
  } catch (const std::exception&) {
    spdlog::warn("{}='{}' is not a number, using {}", key, v, defval);
    return defval;
  }
}

void set_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
  _putenv_s(key.c_str(), value.c_str());
#else
  setenv(key.c_str(), value.c_str(), 0);
#endif
}

} // namespace

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

int loadDotEnv(const std::string& path) {
  std::ifstream in(path);
  if (!in) return 0;

  int set = 0;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const auto key = trim(line.substr(0, eq));
    auto value = trim(line.substr(eq + 1));
    if (key.empty()) continue;
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }

    if (std::getenv(key.c_str())) continue;
    set_env(key, value);
    ++set;
  }
  return set;
}

VaultConfig loadConfig() {
  VaultConfig cfg;
  cfg.store.uri = get_env_or("VAULT_DB_URI", "");
  if (cfg.store.uri.empty()) {
    throw ConfigError("VAULT_DB_URI is missing in .env. Please set it before running the app.");
  }
  cfg.store.tls_cert_path = get_env_or("VAULT_CERT_PATH", "");
  cfg.store.timeout_ms    = env_int_or("VAULT_CONNECT_TIMEOUT_MS", 5000);

  cfg.backupDir  = get_env_or("VAULT_BACKUP_DIR", cfg.backupDir);
  cfg.exportPath = get_env_or("VAULT_EXPORT_PATH", cfg.exportPath);
  cfg.schemaPath = get_env_or("VAULT_SCHEMA_PATH", "");
  cfg.port       = env_int_or("VAULT_PORT", 8080);
  cfg.apiKey     = get_env_or("VAULT_API_KEY", "");
  cfg.logLevel   = get_env_or("VAULT_LOG_LEVEL", cfg.logLevel);
  return cfg;
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("VAULT_LOG_LEVEL='{}' is not a log level, using info", name);
    return spdlog::level::info;
  }
  return level;
}

std::string findSchemaPath(const VaultConfig& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (fs::exists(cfg.schemaPath)) return cfg.schemaPath;
    throw ConfigError("schema file not found: " + cfg.schemaPath);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/store/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw ConfigError("schema.sql not found (looked in CWD and src/core/store)");
}

} // namespace vault
