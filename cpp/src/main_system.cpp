#include "config.hpp"
#include "symbol_registry.hpp"
#include "matching_engine.hpp"
#include "journal_trade_store.hpp"
#include "in_memory_store.hpp"
#include "task_executor.hpp"
#include "order_flow_orchestrator.hpp"
#include "market_data_publisher.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <signal.h>
#include <memory>

// Global flag for signal handling
std::atomic<bool> g_running{true};

void signal_handler(int signal_number) {
    std::cout << "\n🛑 Shutdown signal received (signal " << signal_number << ")..." << std::endl;
    g_running = false;
}

int main() {
    std::cout << "🚀 Perp Matching Service Starting..." << std::endl;
    std::cout << "📋 System Components:" << std::endl;
    std::cout << "   • Matching Engine (price-time priority)" << std::endl;
    std::cout << "   • Order Flow Orchestrator (async persistence)" << std::endl;
    std::cout << "   • Trade Journal (JSON lines)" << std::endl;
    std::cout << "   • Market Data Publisher (WebSocket)" << std::endl;
    std::cout << "   • Latency Tracker (Microsecond precision)" << std::endl;

    // Set up signal handling
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        perp::load_dotenv();
        perp::EngineConfig config = perp::load_config_from_env();
        config.print();

        perp::SymbolRegistry registry(config.symbols);
        perp::MatchingEngine engine(registry, config.fee_config(), config.engine_options());

        perp::JournalTradeStore store(config.journal_path);
        perp::PositionLedger positions;

        perp::InMemoryReferralDirectory referrals;
        if (!config.referrals_path.empty()) {
            size_t loaded = referrals.load_from_file(config.referrals_path);
            std::cout << "🤝 Loaded " << loaded << " referral links from " << config.referrals_path << std::endl;
        }

        perp::TaskExecutor executor(config.persistence_threads);
        perp::OrderFlowOrchestrator orchestrator(engine, store, positions, referrals, executor);

        // Rest open orders before any new flow arrives
        orchestrator.recover_open_orders();
        orchestrator.start_persistence_worker();

        std::unique_ptr<perp::MarketDataPublisher> publisher;
        if (config.websocket_enabled) {
            publisher = std::make_unique<perp::MarketDataPublisher>(engine, config.websocket_port);
            if (!publisher->start()) {
                std::cerr << "❌ Market data publisher failed to start, continuing without it" << std::endl;
                publisher.reset();
            }
        }

        std::cout << "🔄 System running... Press Ctrl+C to stop" << std::endl;

        int status_counter = 0;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            if (++status_counter % 30 == 0) {
                perp::EngineStats stats = engine.get_stats();
                perp::OrchestratorStats flow = orchestrator.get_stats();
                std::cout << "\n📊 STATUS: orders=" << stats.orders_submitted
                          << " trades=" << stats.trades_executed
                          << " volume=" << stats.total_volume
                          << " persisted=" << flow.trades_persisted
                          << " failed=" << flow.trade_failures
                          << " lagged=" << flow.lagged_messages
                          << " pending_tasks=" << executor.pending() << std::endl;
            }
        }

        // Shutdown in reverse order of dependencies
        std::cout << "🛑 Shutting down..." << std::endl;
        if (publisher) {
            publisher->stop();
        }
        orchestrator.stop();
        executor.shutdown();

        std::cout << "\n📊 FINAL STATISTICS:" << std::endl;
        engine.print_performance_report();
        orchestrator.latency_tracker().print_latency_report();

        std::cout << "✅ System shutdown complete!" << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
