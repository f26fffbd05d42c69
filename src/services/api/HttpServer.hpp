#pragma once
#include <atomic>
#include <memory>
#include <string>

namespace vault {

class VaultController;

// JSON API over the vault operations. Requests are served on httplib's
// worker pool; vault operations still run one at a time.
class HttpServer {
public:
  // apiKey: if empty, auth is disabled (useful for early integration).
  HttpServer(VaultController& vault, std::string apiKey);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  bool bind(const std::string& host, int port);
  // Returns the chosen port, or -1.
  int bindToAnyPort(const std::string& host);

  // Serves until stop(). Call after a successful bind.
  bool listen();
  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

// Start a blocking HTTP server on 0.0.0.0:port.
// Returns once `stop` becomes true or the port cannot be bound; sets `stop`
// on return.
void run_http_server(VaultController& vault,
                     int port,
                     const std::string& apiKey,
                     std::atomic<bool>& stop);

} // namespace vault
