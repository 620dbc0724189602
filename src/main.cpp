// Entry point for the activity analysis HTTP server. It wires up the httplib
// server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.

#include "http/http_handler.hpp"
#include "infra/HttpElevationService.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

// "/analyze" -> "analyze"
static std::string action_of(const std::string &path) {
  return (!path.empty() && path[0] == '/') ? path.substr(1) : path;
}

// Run one handler; anything it lets escape becomes a 500.
template <typename Fn>
static void guarded(const char *method, const std::string &action,
                    httplib::Response &res, Fn &&fn) {
  try {
    fn();
  } catch (const std::exception &e) {
    std::cerr << "[server] " << method << " /" << action
              << " failed: " << e.what() << "\n";
    res.status = 500;
    res.set_content(json{{"ok", false}, {"kind", "internal"}, {"what", e.what()}}
                        .dump(2),
                    "application/json");
  }
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // ---------------------- Load configuration ------------------------------
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  std::ifstream cfg(cfg_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << cfg_path << "\n";
    return 1;
  }
  json settings;
  try {
    cfg >> settings;
  } catch (const json::parse_error &e) {
    std::cerr << "[ERROR] " << cfg_path << ": " << e.what() << "\n";
    return 1;
  }
  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  const ActivityParams defaults =
      ActivityParams::from_json(settings.value("activity", json::object()));

  // ---------------------- Elevation service -------------------------------
  std::unique_ptr<HttpElevationService> elevation;
  const json elev_cfg = settings.value("elevation", json::object());
  const std::string elev_url = elev_cfg.value("url", "");
  if (!elev_url.empty()) {
    elevation = std::make_unique<HttpElevationService>(
        elev_url, elev_cfg.value("batch_size", 500),
        elev_cfg.value("timeout_s", 30));
    std::cout << "[server] elevation lookups via " << elev_url << "\n";
  }
  HttpHandler handler(defaults, elevation.get());

  // ---------------------- HTTP server ------------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 128ull); // 128MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  for (const auto &ep : server_cfg.value("post_endpoints", json::array())) {
    const std::string path = ep.get<std::string>();
    server.Post(path, [action = action_of(path), &handler](
                          const httplib::Request &req, httplib::Response &res) {
      guarded("POST", action, res,
              [&] { handler.callPostHandler(action, req, res); });
    });
    std::cout << "[server] POST " << path << "\n";
  }
  for (const auto &ep : server_cfg.value("get_endpoints", json::array())) {
    const std::string path = ep.get<std::string>();
    server.Get(path, [action = action_of(path), &handler](
                         const httplib::Request &req, httplib::Response &res) {
      guarded("GET", action, res,
              [&] { handler.callGetHandler(action, req, res); });
    });
    std::cout << "[server] GET  " << path << "\n";
  }

  // ---------------------- Start server ------------------------------------
  std::cout << "[server] listening on port " << port << std::endl;
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[ERROR] cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}
