#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "core/format/RecordFormat.hpp"
#include "core/vault/VaultController.hpp"

using nlohmann::json;

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true; // auth disabled
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content("unauthorized", "text/plain");
  return false;
}

static std::string param_or(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

static int status_for(vault::ErrorKind kind) {
  switch (kind) {
    case vault::ErrorKind::None:             return 200;
    case vault::ErrorKind::Validation:
    case vault::ErrorKind::InvalidSelection:
    case vault::ErrorKind::InvalidId:        return 400;
    case vault::ErrorKind::NotFound:         return 404;
    case vault::ErrorKind::IoFailure:        return 500;
    case vault::ErrorKind::StoreFailure:     return 503;
  }
  return 500;
}

static json stats_json(const vault::VaultStats& s) {
  auto ts = [](const std::optional<int64_t>& ms) -> json {
    return ms ? json(vault::format_iso_utc(*ms)) : json(nullptr);
  };
  return {
    {"total",             s.total},
    {"lastModified",      ts(s.last_modified)},
    {"earliestCreated",   ts(s.earliest_created)},
    {"latestCreated",     ts(s.latest_created)},
    {"longestName",       s.longest_name ? json(*s.longest_name) : json(nullptr)},
    {"longestNameLength", s.longest_name_length}
  };
}

static void reply(httplib::Response& res, const vault::OpResult& r) {
  json out = {
    {"ok",      r.ok()},
    {"message", r.message},
    {"records", r.records}
  };
  if (!r.ok()) out["error"] = vault::to_string(r.error);
  if (r.stats) out["stats"] = stats_json(*r.stats);
  if (!r.artifact.empty()) out["artifact"] = r.artifact;
  res.status = status_for(r.error);
  res.set_content(out.dump(), "application/json");
}

// Body fields "name" / "details"; missing keys read as empty.
static bool parse_body(const httplib::Request& req, httplib::Response& res,
                       std::string& name, std::string& details) {
  json j = json::object();
  if (!req.body.empty()) {
    try { j = json::parse(req.body); }
    catch (const json::parse_error&) {
      res.status = 400; res.set_content("invalid JSON body", "text/plain"); return false;
    }
  }
  if (!j.is_object()) {
    res.status = 400; res.set_content("JSON body must be an object", "text/plain"); return false;
  }
  auto get_s = [&](const char* k) {
    if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
    return std::string();
  };
  name = get_s("name");
  details = get_s("details");
  return true;
}

// -------- server --------

namespace vault {

struct HttpServer::Impl {
  Impl(VaultController& v, std::string key) : vault(v), apiKey(std::move(key)) {}

  VaultController& vault;
  std::string apiKey;
  httplib::Server svr;
  std::mutex opMutex;
};

HttpServer::HttpServer(VaultController& vault, std::string apiKey)
  : impl_(std::make_unique<Impl>(vault, std::move(apiKey))) {
  auto& svr = impl_->svr;
  Impl* self = impl_.get();

  auto handle = [self](const httplib::Request& req, httplib::Response& res, auto&& op) {
    if (!check_api_key(req, self->apiKey, res)) return;
    std::lock_guard<std::mutex> lock(self->opMutex);
    reply(res, op());
  };

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  svr.Get("/records", [self, handle](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [&] { return self->vault.listRecords(); });
  });

  // POST /records  {"name": "...", "details": "..."}
  svr.Post("/records", [self, handle](const httplib::Request& req, httplib::Response& res) {
    std::string name, details;
    if (!parse_body(req, res, name, details)) return;
    handle(req, res, [&] { return self->vault.addRecord(name, details); });
  });

  svr.Get("/records/search", [self, handle](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [&] {
      return self->vault.searchRecords(param_or(req, "by", "name"), param_or(req, "term"));
    });
  });

  svr.Get("/records/sorted", [self, handle](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [&] {
      return self->vault.sortRecords(param_or(req, "field"), param_or(req, "direction"));
    });
  });

  // PATCH /records/<id>  {"name": "...", "details": "..."}; empty fields stay as they are
  svr.Patch(R"(/records/([^/]+))", [self, handle](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    std::string name, details;
    if (!parse_body(req, res, name, details)) return;
    handle(req, res, [&] { return self->vault.updateRecord(id, name, details); });
  });

  // DELETE /records/<id>?confirm=true
  svr.Delete(R"(/records/([^/]+))", [self, handle](const httplib::Request& req, httplib::Response& res) {
    const std::string id = req.matches[1];
    const bool confirmed = param_or(req, "confirm") == "true";
    handle(req, res, [&] { return self->vault.deleteRecord(id, confirmed); });
  });

  svr.Post("/export", [self, handle](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [&] { return self->vault.exportData(); });
  });

  svr.Get("/stats", [self, handle](const httplib::Request& req, httplib::Response& res) {
    handle(req, res, [&] { return self->vault.viewStatistics(); });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });
}

HttpServer::~HttpServer() = default;

bool HttpServer::bind(const std::string& host, int port) {
  return impl_->svr.bind_to_port(host.c_str(), port);
}

int HttpServer::bindToAnyPort(const std::string& host) {
  return impl_->svr.bind_to_any_port(host.c_str());
}

bool HttpServer::listen() {
  return impl_->svr.listen_after_bind();
}

void HttpServer::stop() {
  impl_->svr.stop();
}

void run_http_server(VaultController& vault,
                     int port,
                     const std::string& apiKey,
                     std::atomic<bool>& stop) {
  HttpServer server(vault, apiKey);
  if (!server.bind("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
    stop.store(true);
    return;
  }

  std::thread watcher([&] {
    while (!stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(200));
    server.stop();
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!server.listen()) {
    spdlog::error("HTTP server on port {} stopped with an error", port);
  }
  stop.store(true);  // listen() may have returned on its own; release the watcher
  watcher.join();
}

} // namespace vault
