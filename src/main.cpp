// src/main.cpp
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/config/VaultConfig.hpp"
#include "core/record/VaultError.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/InitDb.hpp"
#include "core/store/SqliteRecordStore.hpp"
#include "core/vault/VaultController.hpp"
#include "services/api/HttpServer.hpp"
#include "services/cli/MenuDriver.hpp"

// ---------- helpers ----------

static std::atomic<bool> g_stop{false};

static void on_sigint(int) { g_stop.store(true); }

// No SA_RESTART: a blocking read on stdin returns so the menu can unwind.
static void install_sigint_handler() {
#ifdef _WIN32
  std::signal(SIGINT, on_sigint);
#else
  struct sigaction sa{};
  sa.sa_handler = on_sigint;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
#endif
}

static void setup_logging(const std::string& level) {
  auto logger = spdlog::stderr_color_mt("vault");
  spdlog::set_default_logger(logger);
  spdlog::set_level(vault::parseLogLevel(level));
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " [--interactive]  # menu-driven vault (default)\n"
            << "  " << argv0 << " --init           # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve          # start HTTP server (VAULT_PORT or 8080)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  const std::string mode = argc > 1 ? argv[1] : "--interactive";
  if (mode != "--interactive" && mode != "--init" && mode != "--serve") {
    print_usage(argv[0]);
    return 1;
  }

  vault::loadDotEnv(".env");

  vault::VaultConfig cfg;
  std::string schemaPath;
  try {
    cfg = vault::loadConfig();
    setup_logging(cfg.logLevel);
    schemaPath = vault::findSchemaPath(cfg);
    // Self-heal DB on startup (idempotent)
    vault::initDatabase(cfg.store.uri, schemaPath);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (mode == "--init") {
    std::cout << "DB initialized at: " << cfg.store.uri << "\n";
    return 0;
  }

  try {
    // The one store handle for this process; closed when it goes out of scope.
    std::unique_ptr<vault::SqliteRecordStore> store;
    try {
      store = std::make_unique<vault::SqliteRecordStore>(cfg.store);
    } catch (const vault::StoreUnavailable& e) {
      std::cerr << "Failed to connect to store: " << e.what() << "\n";
      return 1;
    }
    std::cout << "Connected to store.\n";

    vault::LocalFSBackend files(cfg.backupDir, cfg.exportPath);
    files.ensureBackupDir();

    vault::VaultController controller(*store, files);
    install_sigint_handler();

    if (mode == "--serve") {
      vault::run_http_server(controller, cfg.port, cfg.apiKey, g_stop);
    } else {
      vault::MenuDriver menu(controller, std::cin, std::cout, &g_stop);
      menu.run();
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
