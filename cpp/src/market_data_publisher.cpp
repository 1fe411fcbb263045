#include "market_data_publisher.hpp"
#include "symbol_registry.hpp"
#include "log_control.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <unordered_map>

// WebSocket server (plain asio transport)
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

using WebSocketServer = websocketpp::server<websocketpp::config::asio>;
using WebSocketMessage = WebSocketServer::message_ptr;

namespace perp {

namespace {

constexpr auto kPumpPollInterval = std::chrono::milliseconds(100);

bool parse_channel(const std::string& text, FeedChannel& channel) {
    if (text == "trades") {
        channel = FeedChannel::TRADES;
        return true;
    }
    if (text == "orderbook") {
        channel = FeedChannel::ORDERBOOK;
        return true;
    }
    return false;
}

std::string encode_frame(FeedChannel channel, const std::string& symbol, const json& data) {
    json frame;
    frame["channel"] = channel_to_string(channel);
    frame["symbol"] = symbol;
    frame["data"] = data;
    return frame.dump();
}

} // namespace

std::string channel_to_string(FeedChannel channel) {
    switch (channel) {
        case FeedChannel::TRADES: return "trades";
        case FeedChannel::ORDERBOOK: return "orderbook";
        default: return "unknown";
    }
}

std::string encode_trade_frame(const TradeEvent& event) {
    return encode_frame(FeedChannel::TRADES, event.symbol, json(event));
}

std::string encode_orderbook_frame(const OrderbookUpdate& update) {
    return encode_frame(FeedChannel::ORDERBOOK, update.symbol, json(update));
}

// =============================================================================
// SUBSCRIPTION TABLE
// =============================================================================

SubscriptionTable::SubscriptionTable(std::vector<std::string> valid_symbols)
    : valid_symbols_(std::move(valid_symbols)) {
}

void SubscriptionTable::add_connection(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_[id];
}

void SubscriptionTable::remove_connection(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.erase(id);
}

std::string SubscriptionTable::error_reply(const std::string& message) {
    return json{{"type", "error"}, {"message", message}}.dump();
}

std::string SubscriptionTable::handle_request(ConnectionId id, const std::string& payload) {
    json request;
    try {
        request = json::parse(payload);
    } catch (const json::parse_error&) {
        return error_reply("invalid JSON");
    }
    if (!request.is_object()) {
        return error_reply("request must be a JSON object");
    }

    const std::string type = request.value("type", std::string());
    if (type == "ping") {
        return json{{"type", "pong"}}.dump();
    }
    if (type != "subscribe" && type != "unsubscribe") {
        return error_reply("unknown request type: " + type);
    }

    auto channel_it = request.find("channel");
    auto symbol_it = request.find("symbol");
    if (channel_it == request.end() || !channel_it->is_string() ||
        symbol_it == request.end() || !symbol_it->is_string()) {
        return error_reply("channel and symbol are required");
    }

    FeedChannel channel;
    if (!parse_channel(channel_it->get<std::string>(), channel)) {
        return error_reply("unknown channel: " + channel_it->get<std::string>());
    }

    const std::string symbol = SymbolRegistry::normalize(symbol_it->get<std::string>());
    if (std::find(valid_symbols_.begin(), valid_symbols_.end(), symbol) == valid_symbols_.end()) {
        return error_reply("Symbol not found: " + symbol);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) {
            return error_reply("connection is closed");
        }
        if (type == "subscribe") {
            it->second.insert(Topic(channel, symbol));
        } else {
            it->second.erase(Topic(channel, symbol));
        }
    }

    json reply;
    reply["type"] = type == "subscribe" ? "subscribed" : "unsubscribed";
    reply["channel"] = channel_to_string(channel);
    reply["symbol"] = symbol;
    return reply.dump();
}

std::vector<ConnectionId> SubscriptionTable::recipients(FeedChannel channel, const std::string& symbol) const {
    const Topic topic(channel, symbol);
    std::vector<ConnectionId> ids;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : subscriptions_) {
        if (entry.second.count(topic) > 0) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

bool SubscriptionTable::is_subscribed(ConnectionId id, FeedChannel channel, const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    return it != subscriptions_.end() && it->second.count(Topic(channel, symbol)) > 0;
}

size_t SubscriptionTable::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

size_t SubscriptionTable::subscription_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : subscriptions_) {
        total += entry.second.size();
    }
    return total;
}

// =============================================================================
// SERVER STATE
// =============================================================================

struct MarketDataPublisher::ServerState {
    WebSocketServer server;

    std::mutex connections_mutex;
    ConnectionId next_id = 1;
    std::map<websocketpp::connection_hdl, ConnectionId, std::owner_less<websocketpp::connection_hdl>> ids;
    std::unordered_map<ConnectionId, websocketpp::connection_hdl> handles;
};

// =============================================================================
// CONSTRUCTOR AND DESTRUCTOR
// =============================================================================

MarketDataPublisher::MarketDataPublisher(MatchingEngine& engine, uint16_t port)
    : engine_(engine)
    , port_(port)
    , subscriptions_(engine.symbols())
    , server_(std::make_unique<ServerState>())
    , running_(false)
    , connections_opened_(0)
    , connections_closed_(0)
    , frames_sent_(0)
    , send_failures_(0)
    , lagged_messages_(0)
    , client_requests_(0) {

    WebSocketServer& server = server_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_open_handler([this](websocketpp::connection_hdl hdl) {
        ConnectionId id;
        {
            std::lock_guard<std::mutex> lock(server_->connections_mutex);
            id = server_->next_id++;
            server_->ids[hdl] = id;
            server_->handles[id] = hdl;
        }
        subscriptions_.add_connection(id);
        connections_opened_.fetch_add(1);
        std::cout << kLogPublisher << "Client " << id << " connected" << std::endl;
    });

    server.set_close_handler([this](websocketpp::connection_hdl hdl) {
        ConnectionId id = 0;
        {
            std::lock_guard<std::mutex> lock(server_->connections_mutex);
            auto it = server_->ids.find(hdl);
            if (it == server_->ids.end()) {
                return;
            }
            id = it->second;
            server_->handles.erase(id);
            server_->ids.erase(it);
        }
        subscriptions_.remove_connection(id);
        connections_closed_.fetch_add(1);
        std::cout << kLogPublisher << "Client " << id << " disconnected" << std::endl;
    });

    server.set_message_handler([this](websocketpp::connection_hdl hdl, WebSocketMessage msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        ConnectionId id = 0;
        {
            std::lock_guard<std::mutex> lock(server_->connections_mutex);
            auto it = server_->ids.find(hdl);
            if (it == server_->ids.end()) {
                return;
            }
            id = it->second;
        }
        client_requests_.fetch_add(1);

        const std::string reply = subscriptions_.handle_request(id, msg->get_payload());
        websocketpp::lib::error_code ec;
        server_->server.send(hdl, reply, websocketpp::frame::opcode::text, ec);
        if (ec) {
            send_failures_.fetch_add(1);
            std::cerr << kLogPublisher << "Reply to client " << id << " failed: " << ec.message() << std::endl;
        }
    });

    std::cout << kLogPublisher << "Initialized for " << engine_.symbols().size()
              << " symbols on port " << port_ << std::endl;
}

MarketDataPublisher::~MarketDataPublisher() {
    stop();
}

// =============================================================================
// LIFECYCLE
// =============================================================================

bool MarketDataPublisher::start() {
    if (running_.load()) {
        std::cout << kLogPublisher << "Already running" << std::endl;
        return false;
    }

    WebSocketServer& server = server_->server;
    websocketpp::lib::error_code ec;
    server.listen(port_, ec);
    if (ec) {
        std::cerr << kLogPublisher << "Cannot listen on port " << port_ << ": " << ec.message() << std::endl;
        return false;
    }
    server.start_accept(ec);
    if (ec) {
        std::cerr << kLogPublisher << "Cannot accept connections: " << ec.message() << std::endl;
        server.stop_listening(ec);
        return false;
    }

    running_.store(true);

    // Subscribe before the pumps start so nothing published from here on is missed
    TradeReceiver trades = engine_.subscribe_trades();
    OrderbookReceiver books = engine_.subscribe_orderbook();

    server_thread_ = std::thread(&MarketDataPublisher::server_thread_main, this);
    trade_thread_ = std::thread(&MarketDataPublisher::trade_pump, this, std::move(trades));
    orderbook_thread_ = std::thread(&MarketDataPublisher::orderbook_pump, this, std::move(books));

    std::cout << kLogPublisher << "Listening on port " << port_ << std::endl;
    return true;
}

void MarketDataPublisher::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    std::cout << kLogPublisher << "Stopping..." << std::endl;

    if (trade_thread_.joinable()) {
        trade_thread_.join();
    }
    if (orderbook_thread_.joinable()) {
        orderbook_thread_.join();
    }

    WebSocketServer& server = server_->server;
    websocketpp::lib::error_code ec;
    server.stop_listening(ec);
    if (ec) {
        std::cerr << kLogPublisher << "stop_listening: " << ec.message() << std::endl;
    }

    std::vector<websocketpp::connection_hdl> open;
    {
        std::lock_guard<std::mutex> lock(server_->connections_mutex);
        for (const auto& entry : server_->handles) {
            open.push_back(entry.second);
        }
    }
    for (auto& hdl : open) {
        websocketpp::lib::error_code close_ec;
        server.close(hdl, websocketpp::close::status::going_away, "server shutdown", close_ec);
        if (close_ec) {
            std::cerr << kLogPublisher << "close: " << close_ec.message() << std::endl;
        }
    }

    server.stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    PublisherStatistics stats = get_statistics();
    std::cout << kLogPublisher << "Stopped (" << stats.frames_sent << " frames sent, "
              << stats.lagged_messages << " messages lost to lag)" << std::endl;
}

void MarketDataPublisher::server_thread_main() {
    try {
        server_->server.run();
    } catch (const std::exception& e) {
        std::cerr << kLogPublisher << "Server loop terminated: " << e.what() << std::endl;
    }
}

// =============================================================================
// FAN-OUT
// =============================================================================

void MarketDataPublisher::trade_pump(TradeReceiver receiver) {
    while (running_.load()) {
        RecvResult<TradeEvent> result = receiver.recv_for(kPumpPollInterval);
        if (result.status == RecvStatus::OK) {
            fan_out(FeedChannel::TRADES, result.value->symbol, encode_trade_frame(*result.value));
        } else if (result.status == RecvStatus::LAGGED) {
            note_lag(FeedChannel::TRADES, result.missed);
        } else if (result.status == RecvStatus::CLOSED) {
            return;
        }
    }
}

void MarketDataPublisher::orderbook_pump(OrderbookReceiver receiver) {
    while (running_.load()) {
        RecvResult<OrderbookUpdate> result = receiver.recv_for(kPumpPollInterval);
        if (result.status == RecvStatus::OK) {
            fan_out(FeedChannel::ORDERBOOK, result.value->symbol, encode_orderbook_frame(*result.value));
        } else if (result.status == RecvStatus::LAGGED) {
            note_lag(FeedChannel::ORDERBOOK, result.missed);
        } else if (result.status == RecvStatus::CLOSED) {
            return;
        }
    }
}

void MarketDataPublisher::fan_out(FeedChannel channel, const std::string& symbol, const std::string& frame) {
    const std::vector<ConnectionId> ids = subscriptions_.recipients(channel, symbol);
    if (ids.empty()) {
        return;
    }

    std::vector<websocketpp::connection_hdl> targets;
    {
        std::lock_guard<std::mutex> lock(server_->connections_mutex);
        for (ConnectionId id : ids) {
            auto it = server_->handles.find(id);
            if (it != server_->handles.end()) {
                targets.push_back(it->second);
            }
        }
    }

    for (auto& hdl : targets) {
        websocketpp::lib::error_code ec;
        server_->server.send(hdl, frame, websocketpp::frame::opcode::text, ec);
        if (ec) {
            send_failures_.fetch_add(1);
            if constexpr (kEnableHotPathLogging) {
                std::cerr << kLogPublisher << "Send failed: " << ec.message() << std::endl;
            }
        } else {
            frames_sent_.fetch_add(1);
        }
    }
}

void MarketDataPublisher::note_lag(FeedChannel channel, uint64_t missed) {
    lagged_messages_.fetch_add(missed);
    std::cerr << kLogPublisher << "WARNING: " << channel_to_string(channel)
              << " feed lagged " << missed << " messages" << std::endl;
}

PublisherStatistics MarketDataPublisher::get_statistics() const {
    PublisherStatistics stats;
    stats.connections_opened = connections_opened_.load();
    stats.connections_closed = connections_closed_.load();
    stats.frames_sent = frames_sent_.load();
    stats.send_failures = send_failures_.load();
    stats.lagged_messages = lagged_messages_.load();
    stats.client_requests = client_requests_.load();
    return stats;
}

} // namespace perp
