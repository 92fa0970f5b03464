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


#include "remote/session.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/conf/token.hpp"
#include "base/logger.hpp"
#include "base/resp_code.hpp"
#include "base/uuid.hpp"
#include "remote/error.hpp"
#include "remote/http_transport.hpp"
#include "remote/wire.hpp"

#include <fmt/format.h>

namespace firemote {
namespace remote {

Session::Options Session::Options::from_conf() noexcept {
  const conf::token tokc(conf::root::remote);
  const auto def_agent = fmt::format("{}/{}", conf::fixed::app_name(), conf::fixed::app_version());

  return Options{
      .port = tokc.val<Port>("port"sv, API_PORT),
      .dial_port = tokc.val<Port>("dial_port"sv, DIAL_PORT),
      .timeout = tokc.timeout_val(""sv, Millis(5000)),
      .trust = tokc.val<bool>("verify_tls"sv, false) ? TrustPolicy::Verify : TrustPolicy::AcceptAny,
      .user_agent = tokc.val<string>("user_agent"sv, def_agent)};
}

Session::Session(string host, std::unique_ptr<Transport> transport, Options opts,
                 std::optional<string> token) noexcept
    : host_addr(std::move(host)),         //
      transport(std::move(transport)),    //
      opts(std::move(opts)),              //
      client_token(std::move(token))      //
{
  // an empty token (e.g. --token "") is no token
  if (client_token && client_token->empty()) client_token.reset();

  INFO_INIT("host={} port={} paired={}", host_addr, this->opts.port, client_token.has_value());
}

static Session::Options with_port(Session::Options opts, Port port) noexcept {
  opts.port = port;

  return opts;
}

Session::Session(const Device &device, std::unique_ptr<Transport> transport, Options opts) noexcept
    : Session(device.host, std::move(transport), with_port(std::move(opts), device.port)) {}

std::unique_ptr<Session> Session::create(string host, std::optional<string> token) {
  return std::make_unique<Session>(std::move(host), std::make_unique<HttpTransport>(),
                                   Options::from_conf(), std::move(token));
}

bool Session::paired() const noexcept {
  std::scoped_lock lck(mtx);

  return client_token.has_value();
}

std::optional<string> Session::token() const noexcept {
  std::scoped_lock lck(mtx);

  return client_token;
}

JsonDoc Session::request(Method method, csv path, bool authenticated,
                         const std::optional<Fields> &body, std::optional<Millis> timeout) {
  INFO_AUTO_CAT("request");

  Request req{.method = method,
              .target = string(path),
              .headers = fixed_headers(wire::content_json),
              .body = body ? json::serialize(*body) : string(),
              .timeout = timeout.value_or(opts.timeout)};

  // every request is unique, even a retry by the caller
  const UUID request_id;
  req.headers.emplace_back(wire::hdr_request_id, request_id());

  std::unique_lock lck(mtx);

  if (authenticated && client_token) {
    req.headers.emplace_back(wire::hdr_client_token, *client_token);
  }

  const auto reply = transport->exchange(api_endpoint(), req);
  lck.unlock();

  INFO_AUTO("{} status={} request_id={}", path, reply.status, request_id);

  if (!resp_code_ok(reply.status)) {
    throw TransportError(reply.status, reply.body,
                         fmt::format("{} {} {}", path, reply.status, respCodeToView(reply.status)));
  }

  return json::parse(reply.body);
}

bool Session::launch_app(csv app_name) {
  INFO_AUTO_CAT("launch_app");

  const Endpoint ep{
      .scheme = Scheme::Http, .host = host_addr, .port = opts.dial_port, .trust = opts.trust};

  const Request req{.method = Method::Post,
                    .target = fmt::format("{}{}", wire::dial_apps, app_name),
                    .headers = fixed_headers(wire::content_text),
                    .body = string(),
                    .timeout = opts.timeout};

  std::unique_lock lck(mtx);
  const auto reply = transport->exchange(ep, req);
  lck.unlock();

  const auto launched = reply.status == RespCode::Created;

  INFO_AUTO("{} {} status={} launched={}", ep, req.target, reply.status, launched);

  return launched;
}

void Session::assign_token(string tok) noexcept {
  std::scoped_lock lck(mtx);

  client_token.emplace(std::move(tok));
}

Endpoint Session::api_endpoint() const noexcept {
  return Endpoint{.scheme = Scheme::Https, .host = host_addr, .port = opts.port, .trust = opts.trust};
}

Headers Session::fixed_headers(csv content_type) const noexcept {
  Headers headers;

  headers.emplace_back(wire::hdr_content_type, content_type);
  headers.emplace_back(wire::hdr_accept, wire::accept);
  headers.emplace_back(wire::hdr_api_key, wire::api_key);
  headers.emplace_back(wire::hdr_user_agent, opts.user_agent);

  return headers;
}

} // namespace remote
} // namespace firemote
