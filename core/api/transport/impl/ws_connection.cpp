/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transport/impl/ws_connection.hpp"

#include <openssl/tls1.h>

#include "api/transport/error.hpp"

namespace slotwatch::api {

  namespace websocket = boost::beast::websocket;

  WsConnection::WsConnection(common::Uri endpoint)
      : endpoint_{std::move(endpoint)},
        log_{log::createLogger("WsConnection", "rpc")},
        ssl_ctx_{boost::asio::ssl::context::tlsv12_client} {
    secure_ = endpoint_.Schema == "wss";
    port_ = endpoint_.Port.empty() ? (secure_ ? "443" : "80") : endpoint_.Port;
    path_ = endpoint_.Path.empty() ? "/" : endpoint_.Path;
  }

  WsConnection::~WsConnection() {
    close();
  }

  outcome::result<void> WsConnection::connect() {
    close();
    if (endpoint_.error().has_value()) {
      SL_ERROR(log_,
               "Endpoint {} is not valid: {}",
               endpoint_.toString(),
               endpoint_.error().value());
      return TransportError::INVALID_ENDPOINT;
    }
    if (endpoint_.Schema != "ws" and endpoint_.Schema != "wss") {
      SL_ERROR(log_,
               "Unsupported schema '{}' passed for endpoint {}",
               endpoint_.Schema,
               endpoint_.toString());
      return TransportError::INVALID_ENDPOINT;
    }

    boost::beast::error_code ec;
    boost::asio::ip::tcp::resolver resolver{io_context_};
    auto results = resolver.resolve(endpoint_.Host, port_, ec);
    if (ec) {
      SL_ERROR(log_,
               "Unable to resolve host {}: {}",
               endpoint_.Host,
               ec.message());
      return TransportError::CONNECTION_FAILED;
    }

    SL_DEBUG(log_, "Connecting to endpoint {}", endpoint_.toString());
    if (secure_) {
      ssl_ctx_.set_default_verify_paths();
      ssl_ctx_.set_verify_mode(boost::asio::ssl::verify_peer);
      auto ws = std::make_unique<WsSslStream>(io_context_, ssl_ctx_);
      boost::beast::get_lowest_layer(*ws).connect(results, ec);
      if (ec) {
        SL_ERROR(log_,
                 "Unable to connect to {}: {}",
                 endpoint_.toString(),
                 ec.message());
        return TransportError::CONNECTION_FAILED;
      }
      // SNI is required by most TLS terminating proxies
      if (not SSL_set_tlsext_host_name(ws->next_layer().native_handle(),
                                       endpoint_.Host.c_str())) {
        SL_ERROR(log_, "Unable to set SNI hostname {}", endpoint_.Host);
        return TransportError::CONNECTION_FAILED;
      }
      ws->next_layer().handshake(boost::asio::ssl::stream_base::client, ec);
      if (ec) {
        SL_ERROR(log_,
                 "TLS handshake with {} failed: {}",
                 endpoint_.Host,
                 ec.message());
        return TransportError::CONNECTION_FAILED;
      }
      OUTCOME_TRY(handshake(*ws));
      ws_ssl_ = std::move(ws);
      return outcome::success();
    }

    auto ws = std::make_unique<WsTcpStream>(io_context_);
    boost::beast::get_lowest_layer(*ws).connect(results, ec);
    if (ec) {
      SL_ERROR(log_,
               "Unable to connect to {}: {}",
               endpoint_.toString(),
               ec.message());
      return TransportError::CONNECTION_FAILED;
    }
    OUTCOME_TRY(handshake(*ws));
    ws_tcp_ = std::move(ws);
    return outcome::success();
  }

  template <typename WsStreamT>
  outcome::result<void> WsConnection::handshake(WsStreamT &ws) {
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::request_type &req) {
          req.set(boost::beast::http::field::user_agent, "slotwatch");
        }));
    ws.read_message_max(0);

    boost::beast::error_code ec;
    ws.handshake(endpoint_.Host + ":" + port_, path_, ec);
    if (ec) {
      SL_ERROR(log_,
               "Websocket handshake with {} failed: {}",
               endpoint_.toString(),
               ec.message());
      return TransportError::CONNECTION_FAILED;
    }
    SL_INFO(log_, "Connected to {}", endpoint_.toString());
    return outcome::success();
  }

  outcome::result<std::string> WsConnection::request(
      std::string_view payload) {
    if (ws_ssl_) {
      return exchange(*ws_ssl_, payload);
    }
    if (ws_tcp_) {
      return exchange(*ws_tcp_, payload);
    }
    return TransportError::NOT_CONNECTED;
  }

  template <typename WsStreamT>
  outcome::result<std::string> WsConnection::exchange(
      WsStreamT &ws, std::string_view payload) {
    boost::beast::error_code ec;
    ws.text(true);
    ws.write(boost::asio::buffer(payload.data(), payload.size()), ec);
    if (ec) {
      SL_ERROR(
          log_, "Unable to send data through websocket: {}", ec.message());
      return TransportError::SEND_FAILED;
    }
    SL_TRACE(log_, "-> {}", payload);

    boost::beast::flat_buffer buffer;
    ws.read(buffer, ec);
    if (ec) {
      SL_ERROR(log_,
               "Unable to receive data through websocket: {}",
               ec.message());
      return TransportError::RECEIVE_FAILED;
    }
    auto response = boost::beast::buffers_to_string(buffer.data());
    SL_TRACE(log_, "<- {}", response);
    return response;
  }

  void WsConnection::close() {
    boost::beast::error_code ec;
    if (ws_ssl_) {
      if (ws_ssl_->is_open()) {
        ws_ssl_->close(websocket::close_code::normal, ec);
      }
      ws_ssl_.reset();
    }
    if (ws_tcp_) {
      if (ws_tcp_->is_open()) {
        ws_tcp_->close(websocket::close_code::normal, ec);
      }
      ws_tcp_.reset();
    }
    if (ec) {
      SL_DEBUG(log_, "Websocket closed with error: {}", ec.message());
    }
  }

}  // namespace slotwatch::api
