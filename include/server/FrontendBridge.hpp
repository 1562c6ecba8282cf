#pragma once
#include "quotehub/Engine.hpp"
#include "quotehub/MarketDataTypes.hpp"
#include "support/RateLimiter.hpp"
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <set>
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

/*
FrontendBridge:
  Registers with the engine as a data consumer and broadcasts each reconciled
  snapshot as JSON over WebSocket to connected dashboard clients, at most once
  per emit interval. A snapshot that arrives inside the interval is held and
  flushed when the interval ends, so the latest one always goes out.
*/

namespace server {

using json = nlohmann::json;
typedef websocketpp::server<websocketpp::config::asio> WebSocketServerType;
typedef WebSocketServerType::connection_ptr connection_ptr;

class FrontendBridge {
public:
  explicit FrontendBridge(qh::Engine& engine, int port = 3000,
                          std::chrono::milliseconds emit_interval = std::chrono::milliseconds(100));
  ~FrontendBridge();

  // Register with the engine and start the WebSocket server
  void start();

  // Stop the bridge
  void stop();

  // Engine data callback.
  void on_snapshot(const qh::Snapshot& snapshot);

private:
  qh::Engine& engine_;
  int port_;
  std::atomic<bool> running_{false};
  std::unique_ptr<std::thread> ws_thread_;
  qh::Publisher::HandlerId callback_id_{0};

  support::RateLimiter limiter_;
  std::mutex pending_mutex_;
  std::unique_ptr<qh::Snapshot> pending_;   // newest snapshot refused by the limiter
  bool flush_scheduled_{false};
  std::atomic<std::size_t> emitted_{0};

  // WebSocket server state
  std::mutex ws_mutex_;
  std::unique_ptr<WebSocketServerType> ws_server_;
  std::set<connection_ptr> ws_connections_;

  void broadcast_to_clients(const std::string& payload);
  void send_snapshot(websocketpp::connection_hdl hdl);
  void schedule_flush();
  void flush_pending();

  // WebSocket server thread function
  void run_ws_server();
};


} // namespace server
