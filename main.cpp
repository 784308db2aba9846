// -----------------------------------------------------------------------------
// matchcore: exchange process entry point.
//
//   1) Load the configuration (argv[1], or built-in defaults).
//   2) Assemble the ExchangeEngine on the wall clock.
//   3) Subscribe logging callbacks to the notification bus.
//   4) start(): recover books from the store, run the notification loop and
//      the IPC server (PUB telemetry, REP admin commands).
//   5) Idle until Ctrl-C, then stop cleanly.
//
// Thread layout:
//   main thread     → waits for SIGINT
//   notify thread   → logging subscribers, IPC bridge
//   ipc thread      → ZeroMQ PUB/REP
// -----------------------------------------------------------------------------

#include "matchcore/config/engine_config.hpp"
#include "matchcore/domain/order.hpp"
#include "matchcore/domain/order_status.hpp"
#include "matchcore/engine/exchange_engine.hpp"
#include "matchcore/events/event.hpp"
#include "matchcore/store/i_order_store.hpp"
#include "matchcore/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Set by the SIGINT handler, polled by main(). Lock-free atomics are the one
// kind of object a handler may touch.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  matchcore::EngineConfig config;
  if (argc > 1) {
    try {
      config = matchcore::loadConfig(argv[1]);
    } catch (const matchcore::ConfigError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] configuration loaded from " << argv[1] << "\n";
  }

  matchcore::LiveTimeProvider clock;

  try {
    // -----------------------------------------------------------------------
    // 2) Assemble
    // -----------------------------------------------------------------------
    matchcore::ExchangeEngine engine(config, clock);

    // -----------------------------------------------------------------------
    // 3) Logging subscribers (run on the notification thread)
    // -----------------------------------------------------------------------
    engine.notificationBus().subscribe<matchcore::TradeExecutedEvent>(
        [](const matchcore::TradeExecutedEvent& e) {
          std::cout << "[Trade] id=" << e.trade.id
                    << " symbol=" << e.trade.symbol
                    << " price=" << e.trade.price
                    << " amount=" << e.trade.amount
                    << " buy_order=" << e.trade.buy_order_id
                    << " sell_order=" << e.trade.sell_order_id
                    << " taker=" << matchcore::domain::toString(e.trade.taker_side)
                    << "\n";
        });

    engine.notificationBus().subscribe<matchcore::OrderUpdateEvent>(
        [](const matchcore::OrderUpdateEvent& e) {
          std::cout << "[OrderUpdate] order_id=" << e.order.id
                    << " symbol=" << e.order.symbol << " "
                    << matchcore::domain::toString(e.previous_status) << " -> "
                    << matchcore::domain::toString(e.order.status)
                    << " filled=" << e.order.filled_amount << "/"
                    << e.order.amount << "\n";
        });

    engine.notificationBus().subscribe<matchcore::OrderBookUpdatedEvent>(
        [](const matchcore::OrderBookUpdatedEvent& e) {
          std::cout << "[Book] symbol=" << e.snapshot->stats.symbol
                    << " bids=" << e.snapshot->bids.size()
                    << " asks=" << e.snapshot->asks.size() << "\n";
        });

    // -----------------------------------------------------------------------
    // 4) Start
    // -----------------------------------------------------------------------
    engine.start();

    std::signal(SIGINT, sigint_handler);

    std::cout << "[main] Exchange running. Admin commands on "
              << config.ipc.command_endpoint << " (PING, STATUS, BOOK <sym>)\n"
              << "[main] Events published on " << config.ipc.publish_endpoint
              << "\n"
              << "[main] Press Ctrl-C to shut down.\n";

    // -----------------------------------------------------------------------
    // 5) Idle until SIGINT, then stop
    // -----------------------------------------------------------------------
    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] SIGINT received. Stopping engine...\n";
    engine.stop();
  } catch (const matchcore::StoreError& e) {
    std::cerr << "[main] ERROR: store unavailable: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: IPC: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
