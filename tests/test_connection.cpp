#include "chatrelay/connection.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>

#include "socket_pair.hpp"

using namespace chatrelay;

static const sockpp::inet_address kPeer(0xC0A8010Au, 51000);  // 192.168.1.10

TEST_CASE("Connection - new slot is empty", "[connection]") {
  Connection conn(7);
  REQUIRE(conn.get_id() == 7);
  REQUIRE(!conn.is_occupied());
  REQUIRE(conn.peer_address_string().empty());
}

TEST_CASE("Connection - attach occupies the slot", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());
  REQUIRE(conn.is_occupied());
  REQUIRE(conn.peer_address_string() == "192.168.1.10");
  REQUIRE(conn.peer_address().port() == 51000);
}

TEST_CASE("Connection - attach to occupied slot is rejected", "[connection]") {
  SocketPair first, second;
  Connection conn(0);
  REQUIRE(conn.attach(first.take_server(), kPeer).has_value());

  sockpp::tcp_socket extra = second.take_server();
  auto result = conn.attach(std::move(extra), kPeer);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kInvalidState);

  // The original stream is untouched
  REQUIRE(conn.send("still here").has_value());
  REQUIRE(first.recv_exactly(10) == "still here");
}

TEST_CASE("Connection - send delivers the whole payload", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  std::string big(64 * 1024, 'x');
  bool sent = false;
  std::thread writer([&] { sent = conn.send(big).has_value(); });
  std::string got = pair.recv_exactly(big.size());
  writer.join();
  REQUIRE(sent);
  REQUIRE(got == big);
}

TEST_CASE("Connection - send to empty slot reports closed", "[connection]") {
  Connection conn(0);
  auto result = conn.send("hello");
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("Connection - receive returns one chunk", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  REQUIRE(pair.send("hi there"));
  char buf[64];
  auto n = conn.receive(buf, sizeof(buf));
  REQUIRE(n.has_value());
  REQUIRE(std::string(buf, n.value()) == "hi there");
}

TEST_CASE("Connection - receive truncates at buffer size", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  REQUIRE(pair.send("abcdefgh"));
  char buf[4];
  auto first = conn.receive(buf, sizeof(buf));
  REQUIRE(first.value() == 4);
  REQUIRE(std::string(buf, 4) == "abcd");
  auto second = conn.receive(buf, sizeof(buf));
  REQUIRE(std::string(buf, second.value()) == "efgh");
}

TEST_CASE("Connection - receive reports peer close", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  pair.close_client();
  char buf[16];
  auto result = conn.receive(buf, sizeof(buf));
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("Connection - receive on empty slot reports closed", "[connection]") {
  Connection conn(0);
  char buf[16];
  auto result = conn.receive(buf, sizeof(buf));
  REQUIRE(result.get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("Connection - read timeout", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());
  REQUIRE(conn.set_read_timeout(std::chrono::milliseconds(50)).has_value());

  char buf[16];
  auto result = conn.receive(buf, sizeof(buf));
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kTimeout);
  REQUIRE(conn.is_occupied());
}

TEST_CASE("Connection - send is possible while owner is blocked reading", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  std::string received;
  std::thread reader([&] {
    char buf[16];
    auto result = conn.receive(buf, sizeof(buf));
    if (result.has_value()) {
      received.assign(buf, result.value());
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(conn.send("from a peer").has_value());
  REQUIRE(pair.recv_exactly(11) == "from a peer");

  REQUIRE(pair.send("reply"));
  reader.join();
  REQUIRE(received == "reply");
}

TEST_CASE("Connection - shutdown wakes a blocked receive", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  bool woke_with_error = false;
  std::thread reader([&] {
    char buf[16];
    woke_with_error = !conn.receive(buf, sizeof(buf)).has_value();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  conn.shutdown();
  reader.join();
  REQUIRE(woke_with_error);
  REQUIRE(conn.is_occupied());
}

TEST_CASE("Connection - release empties the slot and closes the stream", "[connection]") {
  SocketPair pair;
  Connection conn(3);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());

  REQUIRE(conn.release().has_value());
  REQUIRE(!conn.is_occupied());
  REQUIRE(conn.get_id() == 3);
  REQUIRE(conn.peer_address_string().empty());
  REQUIRE(pair.wait_closed());

  auto again = conn.release();
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == ErrorCode::kInvalidState);
}

TEST_CASE("Connection - released slot accepts a new stream", "[connection]") {
  SocketPair first, second;
  Connection conn(1);
  REQUIRE(conn.attach(first.take_server(), kPeer).has_value());
  REQUIRE(conn.release().has_value());

  REQUIRE(conn.attach(second.take_server(), sockpp::inet_address(0x0A000002u, 1234)).has_value());
  REQUIRE(conn.get_id() == 1);
  REQUIRE(conn.peer_address_string() == "10.0.0.2");
  REQUIRE(conn.send("again").has_value());
  REQUIRE(second.recv_exactly(5) == "again");
}

TEST_CASE("Connection - forward waits for the greeting", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());
  REQUIRE(!conn.is_greeted());

  auto early = conn.forward("too soon");
  REQUIRE(!early.has_value());
  REQUIRE(early.get_error() == ErrorCode::kInvalidState);

  REQUIRE(conn.greet("Hello").has_value());
  REQUIRE(conn.is_greeted());
  REQUIRE(conn.forward("chat").has_value());
  REQUIRE(pair.recv_exactly(9) == "Hellochat");
}

TEST_CASE("Connection - release clears the greeting", "[connection]") {
  SocketPair first, second;
  Connection conn(0);
  REQUIRE(conn.attach(first.take_server(), kPeer).has_value());
  REQUIRE(conn.greet("Hello").has_value());
  REQUIRE(conn.release().has_value());
  REQUIRE(!conn.is_greeted());

  REQUIRE(conn.attach(second.take_server(), kPeer).has_value());
  REQUIRE(!conn.is_greeted());
  REQUIRE(conn.forward("chat").get_error() == ErrorCode::kInvalidState);
}

TEST_CASE("Connection - greet on empty slot reports closed", "[connection]") {
  Connection conn(0);
  REQUIRE(conn.greet("Hello").get_error() == ErrorCode::kConnectionClosed);
  REQUIRE(conn.forward("chat").get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("Connection - write timeout bounds a send to a stalled reader", "[connection]") {
  SocketPair pair;
  Connection conn(0);
  REQUIRE(conn.attach(pair.take_server(), kPeer).has_value());
  REQUIRE(conn.set_write_timeout(std::chrono::milliseconds(100)).has_value());

  auto started = std::chrono::steady_clock::now();
  auto result = conn.send(std::string(8 * 1024 * 1024, 'x'));
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(3));
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kSendFailed);

  // The stream was shut down, so the client drains what arrived and sees EOF
  REQUIRE(pair.wait_closed());

  // Other callers are not blocked on the slot afterwards
  REQUIRE(conn.send("late").get_error() == ErrorCode::kSendFailed);
}

TEST_CASE("Connection - write timeout needs an attached stream", "[connection]") {
  Connection conn(0);
  REQUIRE(conn.set_write_timeout(std::chrono::milliseconds(100)).get_error() == ErrorCode::kSocketError);
}
