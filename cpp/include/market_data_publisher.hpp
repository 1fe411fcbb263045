#pragma once

#include "types.hpp"
#include "matching_engine.hpp"
#include "json_codec.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace perp {

// =============================================================================
// SUBSCRIPTIONS
// =============================================================================

using ConnectionId = uint64_t;

enum class FeedChannel : uint8_t {
    TRADES = 0,
    ORDERBOOK = 1
};

std::string channel_to_string(FeedChannel channel);

/**
 * Which connection listens to which (channel, symbol) pair.
 *
 * Independent of the transport so the request handling can be exercised
 * without sockets. Thread-safe.
 */
class SubscriptionTable {
public:
    explicit SubscriptionTable(std::vector<std::string> valid_symbols);

    void add_connection(ConnectionId id);
    void remove_connection(ConnectionId id);

    /**
     * Apply one client text frame and return the reply frame.
     *
     * Accepted: {"type":"subscribe"|"unsubscribe","channel":"trades"|"orderbook","symbol":S}
     * and {"type":"ping"}. Anything else yields {"type":"error","message":...}.
     */
    std::string handle_request(ConnectionId id, const std::string& payload);

    std::vector<ConnectionId> recipients(FeedChannel channel, const std::string& symbol) const;

    bool is_subscribed(ConnectionId id, FeedChannel channel, const std::string& symbol) const;
    size_t connection_count() const;
    size_t subscription_count() const;

private:
    using Topic = std::pair<FeedChannel, std::string>;

    static std::string error_reply(const std::string& message);

    std::vector<std::string> valid_symbols_;
    mutable std::mutex mutex_;
    std::map<ConnectionId, std::set<Topic>> subscriptions_;
};

/**
 * Outgoing frames: {"channel":..,"symbol":..,"data":{..}}
 */
std::string encode_trade_frame(const TradeEvent& event);
std::string encode_orderbook_frame(const OrderbookUpdate& update);

// =============================================================================
// PUBLISHER
// =============================================================================

struct PublisherStatistics {
    uint64_t connections_opened;
    uint64_t connections_closed;
    uint64_t frames_sent;
    uint64_t send_failures;
    uint64_t lagged_messages;
    uint64_t client_requests;

    PublisherStatistics()
        : connections_opened(0), connections_closed(0), frames_sent(0),
          send_failures(0), lagged_messages(0), client_requests(0) {}
};

/**
 * WebSocket fan-out of the engine's trade and orderbook channels.
 *
 * One websocketpp server (plain asio, no TLS) runs on its own thread; two
 * pump threads drain the engine subscriptions and forward each event to
 * the connections subscribed to its (channel, symbol). A lagging pump
 * logs the number of missed messages and carries on.
 */
class MarketDataPublisher {
public:
    MarketDataPublisher(MatchingEngine& engine, uint16_t port);
    ~MarketDataPublisher();

    MarketDataPublisher(const MarketDataPublisher&) = delete;
    MarketDataPublisher& operator=(const MarketDataPublisher&) = delete;

    /**
     * Bind the port and start serving. Returns false if the listener
     * cannot be opened.
     */
    bool start();
    void stop();

    bool is_running() const { return running_.load(); }
    uint16_t port() const { return port_; }

    const SubscriptionTable& subscriptions() const { return subscriptions_; }
    PublisherStatistics get_statistics() const;

private:
    struct ServerState;

    void server_thread_main();
    void trade_pump(TradeReceiver receiver);
    void orderbook_pump(OrderbookReceiver receiver);
    void fan_out(FeedChannel channel, const std::string& symbol, const std::string& frame);
    void note_lag(FeedChannel channel, uint64_t missed);

    MatchingEngine& engine_;
    uint16_t port_;
    SubscriptionTable subscriptions_;

    std::unique_ptr<ServerState> server_;
    std::atomic<bool> running_;
    std::thread server_thread_;
    std::thread trade_thread_;
    std::thread orderbook_thread_;

    std::atomic<uint64_t> connections_opened_;
    std::atomic<uint64_t> connections_closed_;
    std::atomic<uint64_t> frames_sent_;
    std::atomic<uint64_t> send_failures_;
    std::atomic<uint64_t> lagged_messages_;
    std::atomic<uint64_t> client_requests_;
};

} // namespace perp
