#include "chatrelay.hpp"

#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>

namespace {

chatrelay::Server* g_server = nullptr;

void on_signal(int) {
  if (g_server) {
    g_server->stop();
  }
}

}  // namespace

// Usage: chatrelay_server [-v] [port] [initial_pool_size] [recv_buffer_size]
int main(int argc, char* argv[]) {
  int arg = 1;
  if (arg < argc && std::strcmp(argv[arg], "-v") == 0) {
    chatrelay::Logger::set_level(chatrelay::Logger::Level::kDebug);
    ++arg;
  }

  chatrelay::ServerConfig config;
  const uint64_t limits[] = {UINT16_MAX, SIZE_MAX, SIZE_MAX};
  uint64_t values[] = {config.port, config.initial_pool_size, config.recv_buffer_size};
  for (size_t i = 0; i < 3 && arg < argc; ++i, ++arg) {
    auto parsed = chatrelay::parse_unsigned(argv[arg], limits[i]);
    if (!parsed.has_value() || (i == 2 && parsed.value() == 0)) {
      std::cerr << "Invalid argument: " << argv[arg] << std::endl;
      std::cerr << "Usage: " << argv[0] << " [-v] [port] [initial_pool_size] [recv_buffer_size]" << std::endl;
      return 2;
    }
    values[i] = parsed.value();
  }
  config.port = static_cast<uint16_t>(values[0]);
  config.initial_pool_size = static_cast<size_t>(values[1]);
  config.recv_buffer_size = static_cast<size_t>(values[2]);

  std::signal(SIGPIPE, SIG_IGN);

  try {
    chatrelay::Server server(config);
    g_server = &server;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    server.run();

    g_server = nullptr;
    const auto& stats = server.stats();
    CHATRELAY_LOG_INFO("Served " + std::to_string(stats.total_connections.load()) + " clients, " +
                       std::to_string(stats.messages_in.load()) + " messages in, " +
                       std::to_string(stats.messages_relayed.load()) + " relayed");
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR(std::string("Error: ") + e.what());
    return 1;
  }

  return 0;
}
