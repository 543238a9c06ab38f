/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "api/transport/rpc_connection.hpp"

#include <memory>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "common/uri.hpp"
#include "log/logger.hpp"

namespace slotwatch::api {

  /**
   * Synchronous websocket connection to the node RPC endpoint.
   * Supports ws:// and wss:// schemas.
   */
  class WsConnection final : public RpcConnection {
   public:
    /**
     * @param endpoint - node endpoint, already parsed
     */
    explicit WsConnection(common::Uri endpoint);
    WsConnection(const WsConnection &) = delete;
    WsConnection(WsConnection &&) = delete;
    WsConnection &operator=(const WsConnection &) = delete;
    WsConnection &operator=(WsConnection &&) = delete;

    ~WsConnection() override;

    /// Drops a previous session. On failure the connection stays unconnected.
    outcome::result<void> connect() override;

    outcome::result<std::string> request(std::string_view payload) override;

    void close() override;

   private:
    using TcpStream = boost::beast::tcp_stream;
    using SslStream = boost::beast::ssl_stream<TcpStream>;
    template <typename T>
    using WsStream = boost::beast::websocket::stream<T>;
    using WsTcpStream = WsStream<TcpStream>;
    using WsSslStream = WsStream<SslStream>;

    template <typename WsStreamT>
    outcome::result<void> handshake(WsStreamT &ws);

    template <typename WsStreamT>
    outcome::result<std::string> exchange(WsStreamT &ws,
                                          std::string_view payload);

    const common::Uri endpoint_;
    bool secure_ = false;
    std::string port_;
    std::string path_;
    log::Logger log_;

    boost::asio::io_context io_context_;
    boost::asio::ssl::context ssl_ctx_;
    std::unique_ptr<WsTcpStream> ws_tcp_;
    std::unique_ptr<WsSslStream> ws_ssl_;
  };

}  // namespace slotwatch::api
