#include "adapters/StreamingChannel.hpp"
#include "adapters/FyersCodec.hpp"
#include "quotehub/Errors.hpp"
#include <iostream>

namespace adapter {

StreamingChannel::StreamingChannel(qh::Credentials credentials,
                                   std::shared_ptr<const qh::InstrumentRegistry> registry,
                                   qh::EngineConfig config)
    : credentials_(std::move(credentials)),
      registry_(std::move(registry)),
      config_(std::move(config)) {
    ws_.on_open([this] { handle_open(); });
    ws_.on_message([this](const std::string& text) { handle_text(text); });
    ws_.on_close([this](const std::string& reason) { handle_close(reason); });
}

StreamingChannel::~StreamingChannel() {
    stop();
}

void StreamingChannel::start(support::ShutdownSignal& shutdown) {
    if (running_.exchange(true)) return;
    th_ = std::thread([this, &shutdown] { supervise(shutdown); });
}

void StreamingChannel::supervise(support::ShutdownSignal& shutdown) {
    while (running_.load() && !shutdown.triggered()) {
        try {
            connect_and_run();
        } catch (const std::exception& e) {
            std::cerr << "[StreamingChannel] " << e.what() << "\n";
        }
        if (!running_.load()) break;

        std::cout << "[StreamingChannel] Reconnecting in " << config_.reconnect_backoff.count() << "ms\n";
        if (shutdown.wait_for(config_.reconnect_backoff)) break;
        ++reconnects_;
    }
}

void StreamingChannel::connect_and_run() {
    std::cout << "[StreamingChannel] Connecting to " << config_.ws_uri << "\n";
    ws_.run(config_.ws_uri, {{"Authorization", credentials_.authorization()}});
}

void StreamingChannel::handle_open() {
    auto ids = registry_->identifiers();
    if (!ws_.send(make_subscribe_frame(ids))) {
        std::cerr << "[StreamingChannel] Failed to send subscription\n";
    }
    connected_.store(true);
    std::cout << "[StreamingChannel] Connected, subscribed to " << ids.size() << " symbols\n";

    if (on_status_) {
        qh::ChannelStatus status;
        status.connected = true;
        status.detail = "connected";
        status.subscribed = std::move(ids);
        on_status_(status);
    }
}

void StreamingChannel::handle_close(const std::string& reason) {
    connected_.store(false);
    if (on_status_) {
        qh::ChannelStatus status;
        status.connected = false;
        status.detail = reason;
        on_status_(status);
    } else {
        std::cerr << "[StreamingChannel] Connection ended: " << reason << "\n";
    }
}

std::size_t StreamingChannel::handle_text(const std::string& text) {
    PushMessage msg;
    try {
        msg = parse_push_message(text);
    } catch (const qh::ParseError& e) {
        std::cerr << "[StreamingChannel] Dropping malformed frame: " << e.what() << "\n";
        return 0;
    }

    switch (msg.kind) {
    case PushMessage::Kind::Updates:
        if (!on_updates_) return 0;
        return on_updates_(msg.updates);

    case PushMessage::Kind::Control:
        if (msg.control_type == "cn") {
            std::cout << "[StreamingChannel] Connection message: " << msg.control_text << "\n";
        } else if (msg.control_type == "sub") {
            std::cout << "[StreamingChannel] Subscription message: " << msg.control_text << "\n";
        } else {
            #ifdef QH_DEBUG
                std::cout << "[debug] [StreamingChannel] control " << msg.control_type << ": " << msg.control_text << "\n";
            #endif
        }
        return 0;

    case PushMessage::Kind::Ignored:
        #ifdef QH_DEBUG
            std::cout << "[debug] [StreamingChannel] ignoring frame: " << text.substr(0, 200) << "\n";
        #endif
        return 0;
    }
    return 0;
}

void StreamingChannel::stop() {
    running_.store(false);
    ws_.close();
    if (th_.joinable()) th_.join();
}

}
