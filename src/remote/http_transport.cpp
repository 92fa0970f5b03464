//  firemote - Fire TV remote control client
//  Copyright (C) 2022  Tim Hughey
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//  https://www.wisslanding.com


#include "remote/http_transport.hpp"
#include "base/asio.hpp"
#include "base/elapsed.hpp"
#include "base/logger.hpp"
#include "remote/error.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <fmt/chrono.h>
#include <openssl/ssl.h>
#include <type_traits>

namespace firemote {
namespace remote {

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using http_request = http::request<http::string_body>;
using http_response = http::response<http::string_body>;
using tls_stream = beast::ssl_stream<beast::tcp_stream>;

namespace {

/// @brief Chain of async operations for a single request:
///        resolve, connect, handshake (TLS only), write and read
template <typename Stream> class Flight {
public:
  Flight(asio::io_context &io_ctx, Stream &stream, const Endpoint &ep, const http_request &hreq,
         Millis timeout) noexcept
      : resolver(io_ctx), stream(stream), ep(ep), hreq(hreq), timeout(timeout) {}

  void start() {
    resolver.async_resolve(
        ep.host, fmt::format("{}", ep.port),
        [this](const error_code &op_ec, tcp::resolver::results_type results) {
          if (failed(op_ec, "resolve")) return;

          auto &sock = beast::get_lowest_layer(stream);

          // the expiry covers every operation that follows
          sock.expires_after(timeout);
          sock.async_connect(results, [this](const error_code &op_ec, const tcp::endpoint &) {
            if (failed(op_ec, "connect")) return;

            handshake();
          });
        });
  }

  bool done() const noexcept { return finished; }
  const error_code &error() const noexcept { return ec; }
  csv stage() const noexcept { return failed_stage; }
  http_response &response() noexcept { return hres; }

private:
  bool failed(const error_code &op_ec, csv op) noexcept {
    if (!op_ec) return false;

    ec = op_ec;
    failed_stage = op;
    finished = true;

    return true;
  }

  void handshake() {
    if constexpr (std::is_same_v<Stream, tls_stream>) {
      stream.async_handshake(ssl::stream_base::client, [this](const error_code &op_ec) {
        if (failed(op_ec, "handshake")) return;

        write();
      });
    } else {
      write();
    }
  }

  void write() {
    http::async_write(stream, hreq, [this](const error_code &op_ec, std::size_t) {
      if (failed(op_ec, "write")) return;

      read();
    });
  }

  void read() {
    http::async_read(stream, buffer, hres, [this](const error_code &op_ec, std::size_t) {
      if (failed(op_ec, "read")) return;

      finished = true;
    });
  }

private:
  // order dependent
  tcp::resolver resolver;
  Stream &stream;
  const Endpoint &ep;
  const http_request &hreq;
  const Millis timeout;

  // order independent
  beast::flat_buffer buffer;
  http_response hres;
  error_code ec;
  csv failed_stage{""};
  bool finished{false};
};

template <typename Stream>
Reply run_flight(asio::io_context &io_ctx, Stream &stream, const Endpoint &ep,
                 const http_request &hreq, Millis timeout) {
  Flight<Stream> flight(io_ctx, stream, ep, hreq, timeout);

  flight.start();
  io_ctx.run_for(timeout);

  if (!flight.done()) {
    throw TransportError(0, string(), fmt::format("{} timed out after {}", ep, timeout));
  }

  if (flight.error()) {
    throw TransportError(0, string(),
                         fmt::format("{} {} failed: {}", ep, flight.stage(), flight.error().message()));
  }

  auto &hres = flight.response();

  return Reply{.status = hres.result_int(), .body = std::move(hres.body())};
}

} // namespace

Reply HttpTransport::exchange(const Endpoint &ep, const Request &req) {
  INFO_AUTO_CAT("exchange");

  const auto is_post = req.method == Method::Post;

  http_request hreq{is_post ? http::verb::post : http::verb::get, req.target, 11};
  hreq.set(http::field::host, ep.host);

  for (const auto &[name, val] : req.headers) {
    hreq.set(name, val);
  }

  if (is_post || !req.body.empty()) {
    hreq.body() = req.body;
    hreq.prepare_payload();
  }

  asio::io_context io_ctx;
  Elapsed e;
  Reply reply;

  if (ep.scheme == Scheme::Https) {
    error_code ec;
    ssl::context ssl_ctx(ssl::context::tls_client);

    if (ep.trust == TrustPolicy::Verify) {
      ssl_ctx.set_default_verify_paths(ec);
      if (!ec) ssl_ctx.set_verify_mode(ssl::verify_peer, ec);
    } else {
      ssl_ctx.set_verify_mode(ssl::verify_none, ec);
    }

    if (ec) throw TransportError(0, string(), fmt::format("{} tls setup failed: {}", ep, ec.message()));

    tls_stream stream(io_ctx, ssl_ctx);

    if (ep.trust == TrustPolicy::Verify) {
      // SNI, required by most servers presenting a CA signed certificate
      if (!SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str())) {
        throw TransportError(0, string(), fmt::format("{} unable to set SNI host", ep));
      }

      stream.set_verify_callback(ssl::host_name_verification(ep.host));
    }

    reply = run_flight(io_ctx, stream, ep, hreq, req.timeout);
  } else {
    beast::tcp_stream stream(io_ctx);

    reply = run_flight(io_ctx, stream, ep, hreq, req.timeout);
  }

  INFO_AUTO("{} {}{} status={} body={} elapsed={:.1}", is_post ? "POST" : "GET", ep, req.target,
            reply.status, reply.body.size(), e.as<millis_fp>());

  return reply;
}

} // namespace remote
} // namespace firemote
