#include "TransportWorker.hpp"
#include <iostream>

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

const char* toString(ConnectionState s) {
    switch (s) {
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Connecting: return "Connecting";
    case ConnectionState::Open: return "Open";
    case ConnectionState::Closing: return "Closing";
    }
    return "?";
}

TransportWorker::TransportWorker(std::string url, std::string token, EventQueue& events)
    : m_url(std::move(url))
    , m_token(std::move(token))
    , m_events(events)
    , m_resolver(m_ioc)
    , m_retryTimer(m_ioc)
{
    m_urlValid = parseUrl(m_url, m_parts) && m_parts.scheme == "ws";
}

TransportWorker::~TransportWorker() {
    if (!m_thread.joinable()) return;
    if (!stop()) {
        m_ioc.stop();
    }
    if (m_thread.joinable()) m_thread.join();
}

void TransportWorker::start() {
    if (m_thread.joinable()) {
        std::cout << "[Transport] Already running\n";
        return;
    }
    if (!m_urlValid) {
        std::cerr << "[Transport] Bad websocket url: " << m_url << "\n";
        m_events.push(TransportEvent::Kind::Error, "invalid websocket url: " + m_url);
        return;
    }

    m_running = true;
    m_ioc.restart();
    net::post(m_ioc, [this] { attempt(); });

    std::promise<void> done;
    m_finished = done.get_future();
    m_thread = std::thread([this, done = std::move(done)]() mutable {
        run();
        done.set_value();
    });
}

void TransportWorker::run() {
    std::cout << "[Transport] Worker started for " << m_url << "\n";
    for (;;) {
        try {
            m_ioc.run();
            break;
        }
        catch (const std::exception& e) {
            std::cerr << "[Transport] Handler error: " << e.what() << "\n";
            m_events.push(TransportEvent::Kind::Error, e.what());
        }
    }
    m_state = ConnectionState::Disconnected;
    std::cout << "[Transport] Worker finished\n";
}

bool TransportWorker::stop(std::chrono::milliseconds timeout) {
    m_running = false;
    if (!m_thread.joinable()) return true;

    std::cout << "[Transport] Stopping...\n";
    if (m_state.load() != ConnectionState::Disconnected) {
        m_state = ConnectionState::Closing;
    }
    net::post(m_ioc, [this] { closeNow(); });

    if (m_finished.wait_for(timeout) != std::future_status::ready) {
        std::cerr << "[Transport] Worker did not terminate within " << timeout.count() << "ms\n";
        return false;
    }
    m_thread.join();
    std::cout << "[Transport] Worker terminated\n";
    return true;
}

bool TransportWorker::send(const std::string& text) {
    if (m_state.load() != ConnectionState::Open) {
        std::cerr << "[Transport] Not connected, cannot send message\n";
        m_events.push(TransportEvent::Kind::SendFailed, "not connected");
        return false;
    }
    net::post(m_ioc, [this, text] { enqueueWrite(text); });
    return true;
}

void TransportWorker::attempt() {
    if (!m_running) return;

    const uint64_t gen = ++m_generation;
    m_state = ConnectionState::Connecting;
    m_buffer.clear();
    m_sendQueue.clear();
    m_writing = false;
    m_ws.emplace(m_ioc);

    std::cout << "[Transport] Connecting to " << m_url << "\n";
    m_resolver.async_resolve(m_parts.host, m_parts.port,
        [this, gen](beast::error_code ec, tcp::resolver::results_type results) {
            onResolve(gen, ec, std::move(results));
        });
}

void TransportWorker::onResolve(uint64_t gen, beast::error_code ec, tcp::resolver::results_type results) {
    if (gen != m_generation) return;
    if (ec) return fail(gen, "resolve", ec);

    beast::get_lowest_layer(*m_ws).expires_after(std::chrono::seconds(5));
    beast::get_lowest_layer(*m_ws).async_connect(results,
        [this, gen](beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
            onConnect(gen, ec, ep);
        });
}

void TransportWorker::onConnect(uint64_t gen, beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
    if (gen != m_generation) return;
    if (ec) return fail(gen, "connect", ec);

    // websocket has its own timeouts from here on
    beast::get_lowest_layer(*m_ws).expires_never();

    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(3);
    opt.idle_timeout = std::chrono::seconds(20); // ping after 10s idle
    opt.keep_alive_pings = true;
    m_ws->set_option(opt);

    m_ws->set_option(websocket::stream_base::decorator(
        [token = m_token](websocket::request_type& req) {
            req.set(http::field::authorization, "Bearer " + token);
            req.set(http::field::user_agent, "GridLink");
        }));

    m_hostHeader = m_parts.host + ":" + std::to_string(ep.port());
    m_ws->async_handshake(m_hostHeader, m_parts.target,
        [this, gen](beast::error_code ec) { onHandshake(gen, ec); });
}

void TransportWorker::onHandshake(uint64_t gen, beast::error_code ec) {
    if (gen != m_generation) return;
    if (ec) return fail(gen, "handshake", ec);

    if (!m_running) return linkDown();

    m_state = ConnectionState::Open;
    std::cout << "[Transport] Connected\n";
    m_events.push(TransportEvent::Kind::Opened);
    doRead(gen);
}

void TransportWorker::doRead(uint64_t gen) {
    m_ws->async_read(m_buffer,
        [this, gen](beast::error_code ec, std::size_t) { onRead(gen, ec); });
}

void TransportWorker::onRead(uint64_t gen, beast::error_code ec) {
    if (gen != m_generation) return;

    if (ec == websocket::error::closed) {
        const auto& reason = m_ws->reason();
        std::cout << "[Transport] Closed: " << reason.code << " - "
            << std::string(reason.reason.data(), reason.reason.size()) << "\n";
        return linkDown();
    }
    if (ec) return fail(gen, "read", ec);

    m_events.push(TransportEvent::Kind::MessageReceived, beast::buffers_to_string(m_buffer.data()));
    m_buffer.consume(m_buffer.size());
    doRead(gen);
}

void TransportWorker::enqueueWrite(std::string text) {
    if (m_state.load() != ConnectionState::Open) {
        m_events.push(TransportEvent::Kind::SendFailed, "connection closed before send");
        return;
    }
    m_sendQueue.push_back(std::move(text));
    if (!m_writing) writeNext();
}

void TransportWorker::writeNext() {
    if (m_sendQueue.empty()) {
        m_writing = false;
        return;
    }
    m_writing = true;

    const uint64_t gen = m_generation;
    m_ws->text(true);
    m_ws->async_write(net::buffer(m_sendQueue.front()),
        [this, gen](beast::error_code ec, std::size_t) {
            if (gen != m_generation) return;
            if (ec) {
                m_events.push(TransportEvent::Kind::SendFailed, ec.message());
                return fail(gen, "write", ec);
            }
            m_sendQueue.pop_front();
            writeNext();
        });
}

void TransportWorker::fail(uint64_t gen, const char* what, beast::error_code ec) {
    if (gen != m_generation) return;

    // aborted ops during stop() are expected
    const bool quiet = !m_running && ec == net::error::operation_aborted;
    if (!quiet) {
        std::cerr << "[Transport] " << what << " failed: " << ec.message() << "\n";
        m_events.push(TransportEvent::Kind::Error, std::string(what) + ": " + ec.message());
    }
    linkDown();
}

void TransportWorker::linkDown() {
    // outstanding handlers of this attempt become stale
    ++m_generation;

    if (m_ws) beast::get_lowest_layer(*m_ws).close();
    m_sendQueue.clear();
    m_writing = false;

    m_state = ConnectionState::Disconnected;
    m_events.push(TransportEvent::Kind::Closed);

    if (m_running) scheduleRetry();
}

void TransportWorker::scheduleRetry() {
    std::cout << "[Transport] Reconnecting in " << kReconnectDelay.count() << " seconds...\n";
    m_retryTimer.expires_after(kReconnectDelay);
    m_retryTimer.async_wait([this](beast::error_code ec) {
        if (ec || !m_running) return;
        attempt();
    });
}

void TransportWorker::closeNow() {
    m_retryTimer.cancel();
    m_resolver.cancel();
    if (!m_ws) return;

    if (m_ws->is_open()) {
        // the pending read completes with error::closed and calls linkDown()
        m_ws->async_close(websocket::close_code::normal, [](beast::error_code ec) {
            if (ec && ec != net::error::operation_aborted) {
                std::cerr << "[Transport] Close failed: " << ec.message() << "\n";
            }
        });
        return;
    }
    beast::get_lowest_layer(*m_ws).close();
}
