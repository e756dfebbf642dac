#include "chatrelay/log.hpp"
#include "chatrelay/utils.hpp"

#include <atomic>
#include <cstdint>
#include <iostream>
#include <sockpp/tcp_connector.h>
#include <string>
#include <sys/socket.h>
#include <thread>

// Minimal interactive client: prints whatever the relay sends and forwards
// stdin lines. ":end" asks the relay to close the session.
int main(int argc, char* argv[]) {
  std::string host = (argc > 1) ? argv[1] : "127.0.0.1";
  in_port_t port = 7000;

  if (argc > 2) {
    auto parsed = chatrelay::parse_unsigned(argv[2], UINT16_MAX);
    if (!parsed.has_value()) {
      std::cerr << "Usage: " << argv[0] << " [host] [port]" << std::endl;
      return 2;
    }
    port = static_cast<in_port_t>(parsed.value());
  }

  sockpp::initialize();

  sockpp::tcp_connector conn;
  try {
    if (!conn.connect(sockpp::inet_address(host, port))) {
      CHATRELAY_LOG_ERROR("Cannot connect to " + host + ":" + std::to_string(port) + ": " + conn.last_error_str());
      return 1;
    }
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR(std::string("Cannot resolve ") + host + ": " + e.what());
    return 1;
  }

  std::atomic<bool> running{true};

  sockpp::tcp_socket reader = conn.clone();
  std::thread reader_thread([&running, sock = std::move(reader)]() mutable {
    char buf[2048];
    while (true) {
      ssize_t n = sock.read(buf, sizeof(buf));
      if (n <= 0)
        break;
      std::cout << std::string(buf, static_cast<size_t>(n)) << std::endl;
    }
    std::cout << "[connection closed by server]" << std::endl;
    running = false;
  });

  std::string line;
  while (running && std::getline(std::cin, line)) {
    if (line.empty())
      continue;
    if (conn.write(line) != static_cast<ssize_t>(line.size())) {
      CHATRELAY_LOG_ERROR("Send failed: " + conn.last_error_str());
      break;
    }
    if (line.compare(0, 4, ":end") == 0)
      break;
  }

  // Half-close: the farewell and EOF still arrive on the reader
  if (!conn.shutdown(SHUT_WR)) {
    CHATRELAY_LOG_DEBUG("Shutdown failed: " + conn.last_error_str());
  }
  reader_thread.join();
  return 0;
}
