#include "server/FrontendBridge.hpp"
#include "server/SnapshotJson.hpp"
#include <iostream>

namespace server {

FrontendBridge::FrontendBridge(qh::Engine& engine, int port, std::chrono::milliseconds emit_interval)
    : engine_(engine), port_(port), limiter_(emit_interval) {}

FrontendBridge::~FrontendBridge() {
  stop();
}

void FrontendBridge::start() {
  if (running_.exchange(true)) return;

  callback_id_ = engine_.register_data_callback("FrontendBridge", [this](const qh::Snapshot& snapshot) {
    on_snapshot(snapshot);
  });

  // Start WebSocket server in a separate thread
  ws_thread_ = std::make_unique<std::thread>([this]() {
    run_ws_server();
  });

  std::cout << "[FrontendBridge] WebSocket server starting on port " << port_ << "\n";
}

void FrontendBridge::stop() {
  if (!running_.exchange(false)) return;

  engine_.unregister_data_callback(callback_id_);

  // Stop the WebSocket server
  {
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (ws_server_) {
      try {
        ws_server_->stop_listening();
        ws_server_->stop();  // Explicitly stop the ASIO service
      } catch (const std::exception& e) {
        std::cerr << "[FrontendBridge] Error stopping server: " << e.what() << "\n";
      }
      ws_connections_.clear();
    }
  }

  if (ws_thread_ && ws_thread_->joinable()) {
    ws_thread_->join();
  }

  std::cout << "[FrontendBridge] Server stopped after " << emitted_.load() << " broadcasts\n";
}

void FrontendBridge::on_snapshot(const qh::Snapshot& snapshot) {
  if (!limiter_.try_acquire()) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_ = std::make_unique<qh::Snapshot>(snapshot);
    schedule_flush();
    return;
  }

  {
    // this emission supersedes anything held back
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.reset();
  }

  broadcast_to_clients(market_data_message(snapshot).dump());
}

// must hold pending_mutex_
void FrontendBridge::schedule_flush() {
  if (flush_scheduled_) return;

  std::lock_guard<std::mutex> lock(ws_mutex_);
  if (!ws_server_) return;
  flush_scheduled_ = true;
  ws_server_->set_timer(limiter_.interval().count(), [this](const websocketpp::lib::error_code& ec) {
    if (ec) return;
    flush_pending();
  });
}

void FrontendBridge::flush_pending() {
  std::unique_ptr<qh::Snapshot> snapshot;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    flush_scheduled_ = false;
    snapshot = std::move(pending_);
  }
  if (snapshot) on_snapshot(*snapshot);
}

void FrontendBridge::broadcast_to_clients(const std::string& payload) {
  std::lock_guard<std::mutex> lock(ws_mutex_);
  if (!ws_server_) return;
  for (auto& conn : ws_connections_) {
    try {
      ws_server_->send(conn, payload, websocketpp::frame::opcode::text);
    } catch (const std::exception& e) {
      std::cerr << "[FrontendBridge] Failed to send to client: " << e.what() << "\n";
    }
  }
  ++emitted_;
  #ifdef QH_DEBUG
    std::cout << "[debug] [FrontendBridge] emitted snapshot to " << ws_connections_.size() << " clients\n";
  #endif
}

// must hold ws_mutex_
void FrontendBridge::send_snapshot(websocketpp::connection_hdl hdl) {
  std::string payload = market_data_message(engine_.get_market_data()).dump();
  websocketpp::lib::error_code ec;
  ws_server_->send(hdl, payload, websocketpp::frame::opcode::text, ec);
  if (ec) {
    std::cerr << "[FrontendBridge] Failed to send snapshot: " << ec.message() << "\n";
  }
}

void FrontendBridge::run_ws_server() {
  try {
    auto server = std::make_unique<WebSocketServerType>();

    server->clear_access_channels(websocketpp::log::alevel::all);
    server->set_access_channels(websocketpp::log::alevel::connect | websocketpp::log::alevel::disconnect);

    // Initialize ASIO
    server->init_asio();
    server->set_reuse_addr(true);

    // New clients get the current table straight away
    server->set_open_handler([this](websocketpp::connection_hdl hdl) {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      auto conn = ws_server_->get_con_from_hdl(hdl);
      ws_connections_.insert(conn);
      std::cout << "[FrontendBridge] Client connected. Total clients: " << ws_connections_.size() << "\n";
      send_snapshot(hdl);
    });

    // Handle client disconnect
    server->set_close_handler([this](websocketpp::connection_hdl hdl) {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      auto it = ws_connections_.begin();
      while (it != ws_connections_.end()) {
        if ((*it)->get_handle().lock() == hdl.lock()) {
          it = ws_connections_.erase(it);
        } else {
          ++it;
        }
      }
      std::cout << "[FrontendBridge] Client disconnected. Total clients: " << ws_connections_.size() << "\n";
    });

    // Handle incoming messages ("get_market_data" command)
    server->set_message_handler([this](websocketpp::connection_hdl hdl, WebSocketServerType::message_ptr msg) {
      try {
        json command = json::parse(msg->get_payload());

        if (command.contains("command") && command["command"] == "get_market_data") {
          std::lock_guard<std::mutex> lock(ws_mutex_);
          send_snapshot(hdl);
        }
      } catch (const std::exception& e) {
        std::cerr << "[FrontendBridge] Failed to parse incoming message: " << e.what() << "\n";
      }
    });

    // Listen on the specified port
    server->listen(websocketpp::lib::asio::ip::tcp::v4(), port_);
    server->start_accept();

    // Store server instance
    {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      if (!running_.load()) return;
      ws_server_ = std::move(server);
    }

    std::cout << "[FrontendBridge] WebSocket listening on ws://localhost:" << port_ << "\n";

    // Run the server (blocks until stop() is called)
    ws_server_->run();

    // Cleanup
    {
      std::lock_guard<std::mutex> lock(ws_mutex_);
      ws_server_ = nullptr;
      ws_connections_.clear();
    }

  } catch (const std::exception& e) {
    std::cerr << "[FrontendBridge] WebSocket server error: " << e.what() << "\n";
  }
}

} // namespace server
