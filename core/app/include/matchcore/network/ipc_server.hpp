#pragma once

#include "matchcore/concurrent/thread_safe_queue.hpp"
#include "matchcore/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace matchcore {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ market-data publisher and command endpoint
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two sockets:
//
//   PUB  every engine event as one JSON message (see eventToJson()), so
//        external clients can follow trades, book updates and order
//        status changes.
//   REP  text commands ("PING", "STATUS", "BOOK BTC/USDT") answered with a
//        JSON document produced by the command handler.
//
// @details
// The REP socket has a receive timeout of kPollTimeoutMs, so the worker
// alternates between draining the telemetry queue and waiting for a command.
// A handler that throws is answered with {"error": ...}; a REP socket must
// reply to every request or it stops accepting new ones.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread
//   (in practice the notification loop). The handler runs on the IPC thread.
//
// Ownership:
//   Owned by ExchangeEngine. Owns the context, sockets, queue and thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // No sockets are opened until start().
  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Binds both sockets and spawns the worker. Idempotent.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Stops the worker after a last telemetry drain and closes the sockets.
  void stop();

  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

  // Wire form of one event, as published on the PUB socket.
  static std::string formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  // Runs the handler; a thrown exception becomes an error document.
  std::string handle(const std::string& command) const;

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace matchcore
