#include "support/WebSocketClient.hpp"
#include "quotehub/Errors.hpp"
#include <iostream>

namespace support {

void WebSocketClient::run(const std::string& uri, const Headers& headers) {
    Client client;

    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    #ifdef QH_DEBUG
        client.set_error_channels(websocketpp::log::elevel::warn | websocketpp::log::elevel::rerror);
    #endif

    websocketpp::lib::error_code ec;
    client.init_asio(ec);
    if (ec) throw qh::TransportError("websocket init failed: " + ec.message());

    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto ctx = websocketpp::lib::make_shared<websocketpp::lib::asio::ssl::context>(
            websocketpp::lib::asio::ssl::context::tlsv12_client);
        ctx->set_options(websocketpp::lib::asio::ssl::context::default_workarounds |
                         websocketpp::lib::asio::ssl::context::no_sslv2 |
                         websocketpp::lib::asio::ssl::context::no_sslv3);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        return ctx;
    });

    client.set_open_handler([this](websocketpp::connection_hdl hdl) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hdl_ = hdl;
            open_ = true;
        }
        if (on_open_) on_open_();
    });

    client.set_message_handler([this](websocketpp::connection_hdl, Client::message_ptr msg) {
        if (on_message_) on_message_(msg->get_payload());
    });

    client.set_close_handler([this, &client](websocketpp::connection_hdl hdl) {
        std::string reason;
        try {
            auto con = client.get_con_from_hdl(hdl);
            reason = "closed (" + std::to_string(con->get_remote_close_code()) + ") " +
                     con->get_remote_close_reason();
        } catch (const std::exception& e) {
            reason = std::string("closed: ") + e.what();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }
        if (on_close_) on_close_(reason);
    });

    client.set_fail_handler([this, &client](websocketpp::connection_hdl hdl) {
        std::string reason = "connect failed";
        try {
            auto con = client.get_con_from_hdl(hdl);
            reason = "connect failed: " + con->get_ec().message();
        } catch (const std::exception& e) {
            reason = std::string("connect failed: ") + e.what();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }
        if (on_close_) on_close_(reason);
    });

    Client::connection_ptr con = client.get_connection(uri, ec);
    if (ec) throw qh::TransportError("websocket connection to " + uri + " failed: " + ec.message());
    for (const auto& [name, value] : headers) {
        con->append_header(name, value);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        client_ = &client;
    }
    client.connect(con);

    try {
        client.run();
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        client_ = nullptr;
        open_ = false;
        throw qh::TransportError(std::string("websocket run failed: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    client_ = nullptr;
    open_ = false;
}

bool WebSocketClient::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_ || !open_) return false;
    websocketpp::lib::error_code ec;
    client_->send(hdl_, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        std::cerr << "[WebSocketClient] send failed: " << ec.message() << "\n";
        return false;
    }
    return true;
}

void WebSocketClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    if (!client_) return;
    websocketpp::lib::error_code ec;
    if (open_) {
        client_->close(hdl_, websocketpp::close::status::going_away, "shutdown", ec);
        if (ec) std::cerr << "[WebSocketClient] close failed: " << ec.message() << "\n";
    }
    // a connect in flight has nothing to close; stop the loop instead
    if (!open_ || ec) client_->stop();
}

}
