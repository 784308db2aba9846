#include "matchcore/network/ipc_server.hpp"
#include "matchcore/codec/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace matchcore {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  auto context = std::make_unique<zmq::context_t>(1);
  auto cmd_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto pub_socket =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);

  cmd_socket->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket->set(zmq::sockopt::linger, 0);
  pub_socket->set(zmq::sockopt::linger, 0);
  cmd_socket->bind(cmd_endpoint_);
  pub_socket->bind(pub_endpoint_);

  // Only take ownership once both binds succeeded.
  context_ = std::move(context);
  cmd_socket_ = std::move(cmd_socket);
  pub_socket_ = std::move(pub_socket);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);

  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): drain, then wait up to kPollTimeoutMs for a command
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*event);
    zmq::message_t msg(payload.data(), payload.size());
    // PUB drops when no one is listening; a full pipe is not our problem.
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: telemetry message dropped\n";
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string command(static_cast<const char*>(request.data()),
                            request.size());
  const std::string response = handle(command);

  zmq::message_t reply(response.data(), response.size());
  if (!cmd_socket_->send(reply, zmq::send_flags::none)) {
    std::cerr << "[IpcServer] WARNING: reply to '" << command
              << "' was not sent\n";
  }
}

std::string IpcServer::handle(const std::string& command) const {
  try {
    return command_handler_(command);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] ERROR: command '" << command
              << "' failed: " << e.what() << "\n";
    nlohmann::json j;
    j["error"] = e.what();
    return j.dump();
  }
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return eventToJson(event).dump();
}

}  // namespace matchcore
