#include "adapters/FyersRestApi.hpp"
#include "adapters/PollingChannel.hpp"
#include "adapters/StreamingChannel.hpp"
#include "quotehub/Credentials.hpp"
#include "quotehub/Engine.hpp"
#include "quotehub/Errors.hpp"
#include "quotehub/HistoricalWorker.hpp"
#include "quotehub/HistoryStore.hpp"
#include "quotehub/InstrumentRegistry.hpp"
#include "server/FrontendBridge.hpp"
#include "strategies/TechnicalSignal.hpp"
#include <memory>
#include <iostream>
#include <csignal>
#include <string>

static qh::Engine* g_engine = nullptr;

void signal_handler(int) {
  if (g_engine) {
    g_engine->request_shutdown();
  }
}

static void usage(const char* prog) {
  std::cout << "Usage: " << prog << " [options]\n"
            << "  --auth-dir <dir>        directory holding fyers_client_id.txt and fyers_access_token.txt\n"
            << "  --port <n>              dashboard WebSocket port (default 3000)\n"
            << "  --ws-uri <uri>          provider push endpoint\n"
            << "  --rest-host <host>      provider REST host\n"
            << "  --history-db <path>     SQLite file for daily bars (default history.db)\n"
            << "  --no-history            disable the historical worker\n"
            << "  --poll-seconds <n>      fallback poll interval (default 5)\n";
}

int main(int argc, char* argv[]) {

#ifdef QH_DEBUG
  std::cout << "[Main] debug logging enabled\n";
#endif

  qh::EngineConfig config;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    try {
      if (arg == "--auth-dir" && i + 1 < argc) {
        config.auth_dir = argv[++i];
      } else if (arg == "--port" && i + 1 < argc) {
        config.port = std::stoi(argv[++i]);
      } else if (arg == "--ws-uri" && i + 1 < argc) {
        config.ws_uri = argv[++i];
      } else if (arg == "--rest-host" && i + 1 < argc) {
        config.rest_host = argv[++i];
      } else if (arg == "--history-db" && i + 1 < argc) {
        config.history_db_path = argv[++i];
      } else if (arg == "--no-history") {
        config.enable_history = false;
      } else if (arg == "--poll-seconds" && i + 1 < argc) {
        config.poll_interval = std::chrono::seconds(std::stoi(argv[++i]));
      } else if (arg == "--help" || arg == "-h") {
        usage(argv[0]);
        return 0;
      } else {
        std::cerr << "[Main] Unknown argument: " << arg << "\n";
        usage(argv[0]);
        return 1;
      }
    } catch (const std::exception& e) {
      std::cerr << "[Main] Bad value for " << arg << ": " << e.what() << "\n";
      return 1;
    }
  }

  try {
    // 1. instrument universe and credentials
    auto registry = std::make_shared<const qh::InstrumentRegistry>(qh::nifty50_registry());
    qh::FileCredentialSupplier supplier(config.auth_dir);
    qh::Credentials credentials = supplier.load();

    // 2. the engine
    auto engine = std::make_unique<qh::Engine>(config, registry);
    g_engine = engine.get();  // Store pointer for signal handler

    auto api = std::make_shared<adapter::FyersRestApi>(credentials, config.rest_host);
    engine->set_quote_api(api);

    // 3. channels: polling first so the table is filled before the stream connects
    engine->add_channel(std::make_unique<adapter::PollingChannel>(api, registry, config));
    engine->add_channel(std::make_unique<adapter::StreamingChannel>(credentials, registry, config));

    // 4. historical worker and its store
    if (config.enable_history) {
      std::shared_ptr<qh::HistoryStore> store;
      try {
        store = std::make_shared<qh::HistoryStore>(config.history_db_path);
      } catch (const std::exception& e) {
        std::cerr << "[Main] History store unavailable, continuing without persistence: " << e.what() << "\n";
        store.reset();
      }
      engine->set_historical_worker(std::make_unique<qh::HistoricalWorker>(
          api, registry, strategy::technical_signal, config, store));
    }

    // 5. dashboard bridge
    auto bridge = std::make_unique<server::FrontendBridge>(*engine, config.port, config.emit_interval);
    bridge->start();

    // Set up signal handlers for clean shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    engine->start();
    engine->run();

    std::cout << "\n[Main] Engine run complete. Stopping...\n";
    bridge->stop();
    engine->stop();
    g_engine = nullptr;
  } catch (const qh::CredentialError& e) {
    std::cerr << "[Main] Credential error: " << e.what() << "\n";
    return 2;
  } catch (const qh::RegistryError& e) {
    std::cerr << "[Main] Registry error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << "[Main] Fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[Main] Cleanup complete. Exiting.\n";
  return 0;
}
