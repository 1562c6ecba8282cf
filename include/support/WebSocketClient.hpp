#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

namespace support {

// Thin blocking wrapper over a websocketpp TLS client. One connection per run().
class WebSocketClient {
public:
    using Client = websocketpp::client<websocketpp::config::asio_tls_client>;
    using Headers = std::vector<std::pair<std::string, std::string>>;

    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    void on_open(OpenHandler cb) { on_open_ = std::move(cb); }
    void on_message(MessageHandler cb) { on_message_ = std::move(cb); }
    // Called once when an established connection closes or a connect attempt fails.
    void on_close(CloseHandler cb) { on_close_ = std::move(cb); }

    // Connect and service the connection until it ends.
    // Throws qh::TransportError if the connection cannot even be set up.
    void run(const std::string& uri, const Headers& headers = {});

    // Returns false if there is no open connection or the send failed.
    bool send(const std::string& text);

    // Close the current connection (or abort a pending connect) and refuse
    // further run() calls. Safe from any thread.
    void close();

private:
    OpenHandler on_open_;
    MessageHandler on_message_;
    CloseHandler on_close_;

    std::mutex mutex_;
    Client* client_{nullptr};          // valid only inside run()
    websocketpp::connection_hdl hdl_;
    bool open_{false};
    bool closed_{false};
};

}
