#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "EventQueue.hpp"
#include "FrameSink.hpp"
#include "NetCommon.hpp"

enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Open,
    Closing,
};

const char* toString(ConnectionState s);

// One long-lived websocket on its own thread. Reconnects every kReconnectDelay
// until stop(). All socket work runs on the worker's io_context; send() and
// stop() only post to it.
class TransportWorker : public FrameSink {
public:
    static constexpr std::chrono::seconds kReconnectDelay{ 5 };
    static constexpr std::chrono::milliseconds kStopTimeout{ 5000 };

    TransportWorker(std::string url, std::string token, EventQueue& events);
    ~TransportWorker() override;

    TransportWorker(const TransportWorker&) = delete;
    TransportWorker& operator=(const TransportWorker&) = delete;

    void start();
    bool send(const std::string& text) override;

    // Returns false if the worker thread did not finish within timeout.
    bool stop(std::chrono::milliseconds timeout = kStopTimeout);

    ConnectionState state() const { return m_state.load(); }
    bool isRunning() const { return m_running.load(); }

private:
    using tcp = boost::asio::ip::tcp;
    using WsStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    void run();
    void attempt();
    void onResolve(uint64_t gen, boost::beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(uint64_t gen, boost::beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void onHandshake(uint64_t gen, boost::beast::error_code ec);
    void doRead(uint64_t gen);
    void onRead(uint64_t gen, boost::beast::error_code ec);

    void enqueueWrite(std::string text);
    void writeNext();

    void fail(uint64_t gen, const char* what, boost::beast::error_code ec);
    void linkDown();
    void scheduleRetry();
    void closeNow();

private:
    std::string m_url;
    std::string m_token;
    UrlParts m_parts;
    bool m_urlValid{ false };

    EventQueue& m_events;

    boost::asio::io_context m_ioc;
    tcp::resolver m_resolver;
    boost::asio::steady_timer m_retryTimer;
    std::optional<WsStream> m_ws;
    std::string m_hostHeader;
    boost::beast::flat_buffer m_buffer;

    // touched only on the worker thread
    std::deque<std::string> m_sendQueue;
    bool m_writing{ false };
    uint64_t m_generation{ 0 };

    std::atomic<ConnectionState> m_state{ ConnectionState::Disconnected };
    std::atomic<bool> m_running{ false };

    std::thread m_thread;
    std::future<void> m_finished;
};
