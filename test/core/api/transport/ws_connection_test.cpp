/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "api/transport/error.hpp"
#include "api/transport/impl/ws_connection.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using slotwatch::api::TransportError;
using slotwatch::api::WsConnection;
using slotwatch::common::Uri;

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

  /**
   * Single-session websocket server on 127.0.0.1. Answers every text frame
   * with the same frame prefixed by "echo:" until the peer closes.
   */
  class WsEchoServer {
   public:
    WsEchoServer()
        : acceptor_{io_, {net::ip::make_address("127.0.0.1"), 0}} {}

    ~WsEchoServer() {
      join();
    }

    uint16_t port() const {
      return acceptor_.local_endpoint().port();
    }

    void start() {
      thread_ = std::thread([this] { serve(); });
    }

    void join() {
      if (thread_.joinable()) {
        thread_.join();
      }
    }

    // valid after join()
    std::vector<std::string> received;

   private:
    void serve() {
      beast::error_code ec;
      tcp::socket socket{io_};
      acceptor_.accept(socket, ec);
      if (ec) {
        return;
      }
      websocket::stream<tcp::socket> ws{std::move(socket)};
      ws.accept(ec);
      if (ec) {
        return;
      }
      while (true) {
        beast::flat_buffer buffer;
        ws.read(buffer, ec);
        if (ec) {
          // websocket::error::closed once the client says goodbye
          return;
        }
        auto text = beast::buffers_to_string(buffer.data());
        received.push_back(text);
        auto reply = "echo:" + text;
        ws.text(true);
        ws.write(net::buffer(reply), ec);
        if (ec) {
          return;
        }
      }
    }

    net::io_context io_;
    tcp::acceptor acceptor_;
    std::thread thread_;
  };

  Uri localEndpoint(uint16_t port) {
    return Uri::parse("ws://127.0.0.1:" + std::to_string(port));
  }

}  // namespace

class WsConnectionTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given websocket server on a local port
 * @when connection is established and two requests are sent
 * @then each request gets its own response and the server saw both payloads
 */
TEST_F(WsConnectionTest, RequestRoundTrip) {
  WsEchoServer server;
  server.start();

  WsConnection connection{localEndpoint(server.port())};
  ASSERT_OUTCOME_SUCCESS_TRY(connection.connect());

  const std::string first =
      R"({"jsonrpc":"2.0","id":1,"method":"chain_getHead","params":[]})";
  const std::string second =
      R"({"jsonrpc":"2.0","id":2,"method":"chain_getFinalizedHead","params":[]})";
  EXPECT_OUTCOME_TRUE(first_response, connection.request(first));
  EXPECT_EQ(first_response, "echo:" + first);
  EXPECT_OUTCOME_TRUE(second_response, connection.request(second));
  EXPECT_EQ(second_response, "echo:" + second);

  connection.close();
  server.join();
  EXPECT_EQ(server.received, (std::vector<std::string>{first, second}));
}

/**
 * @given connection which was never connected, and one which was closed
 * @when request is sent
 * @then NOT_CONNECTED is reported
 */
TEST_F(WsConnectionTest, RequestWithoutConnection) {
  WsConnection idle{localEndpoint(9944)};
  EXPECT_EC(idle.request("{}"), TransportError::NOT_CONNECTED);

  WsEchoServer server;
  server.start();
  WsConnection closed{localEndpoint(server.port())};
  ASSERT_OUTCOME_SUCCESS_TRY(closed.connect());
  closed.close();
  server.join();
  EXPECT_EC(closed.request("{}"), TransportError::NOT_CONNECTED);
}

/**
 * @given port where nothing listens
 * @when connecting
 * @then CONNECTION_FAILED is reported
 */
TEST_F(WsConnectionTest, ConnectToClosedPort) {
  uint16_t free_port = 0;
  {
    net::io_context io;
    tcp::acceptor acceptor{io, {net::ip::make_address("127.0.0.1"), 0}};
    free_port = acceptor.local_endpoint().port();
  }

  WsConnection connection{localEndpoint(free_port)};
  EXPECT_EC(connection.connect(), TransportError::CONNECTION_FAILED);
  EXPECT_EC(connection.request("{}"), TransportError::NOT_CONNECTED);
}

/**
 * @given endpoint with a schema other than ws or wss
 * @when connecting
 * @then INVALID_ENDPOINT is reported without touching the network
 */
TEST_F(WsConnectionTest, RejectsHttpEndpoint) {
  WsConnection connection{Uri::parse("http://127.0.0.1:9933")};
  EXPECT_EC(connection.connect(), TransportError::INVALID_ENDPOINT);
}
