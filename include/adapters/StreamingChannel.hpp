#pragma once
#include "quotehub/Credentials.hpp"
#include "quotehub/EngineConfig.hpp"
#include "quotehub/IQuoteChannel.hpp"
#include "quotehub/InstrumentRegistry.hpp"
#include "support/ShutdownSignal.hpp"
#include "support/WebSocketClient.hpp"

#include <atomic>
#include <memory>
#include <thread>

/*
StreamingChannel:
  Holds the provider's push connection. A supervisor thread connects, sends
  one subscribe frame for every instrument, feeds decoded text frames to the
  engine, and reconnects after a fixed backoff whenever the connection drops.
  Control frames are logged and never count as data.
*/

namespace adapter {

class StreamingChannel : public qh::IQuoteChannel {
public:
    StreamingChannel(qh::Credentials credentials,
                     std::shared_ptr<const qh::InstrumentRegistry> registry,
                     qh::EngineConfig config);
    ~StreamingChannel() override;

    std::string name() const override { return "StreamingChannel"; }

    void subscribe_pushes(PushHandler on_updates) override { on_updates_ = std::move(on_updates); }
    void subscribe_status(StatusHandler on_status) override { on_status_ = std::move(on_status); }

    void start(support::ShutdownSignal& shutdown) override;
    void stop() override;
    bool is_connected() const override { return connected_.load(); }

    // Decode one text frame and forward any updates. Returns updates applied.
    std::size_t handle_text(const std::string& text);

    std::size_t reconnects() const { return reconnects_.load(); }

private:
    void supervise(support::ShutdownSignal& shutdown);
    void connect_and_run();
    void handle_open();
    void handle_close(const std::string& reason);

    qh::Credentials credentials_;
    std::shared_ptr<const qh::InstrumentRegistry> registry_;
    qh::EngineConfig config_;

    PushHandler on_updates_;
    StatusHandler on_status_;

    support::WebSocketClient ws_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<std::size_t> reconnects_{0};
    std::thread th_;
};

}
