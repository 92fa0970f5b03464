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


#pragma once

#include "base/types.hpp"
#include "remote/device.hpp"
#include "remote/json.hpp"
#include "remote/transport.hpp"

#include <memory>
#include <mutex>
#include <optional>

namespace firemote {
namespace remote {

class Pairing;

/// @brief One relationship with one device: connection parameters, the
///        client token (once paired) and the transport every request uses.
///        Requests are serialized, one in flight at a time.
class Session {
  friend class Pairing;

public:
  struct Options {
    Port port{API_PORT};
    Port dial_port{DIAL_PORT};
    Millis timeout{5000};
    TrustPolicy trust{TrustPolicy::AcceptAny};
    string user_agent;

    /// @brief Options from the remote configuration table (with defaults)
    static Options from_conf() noexcept;
  };

public:
  Session(string host, std::unique_ptr<Transport> transport, Options opts,
          std::optional<string> token = std::nullopt) noexcept;

  Session(const Device &device, std::unique_ptr<Transport> transport, Options opts) noexcept;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /// @brief Create a session using the configured options and the https transport
  static std::unique_ptr<Session> create(string host, std::optional<string> token = std::nullopt);

  const string &host() const noexcept { return host_addr; }
  const Options &options() const noexcept { return opts; }

  bool paired() const noexcept;
  std::optional<string> token() const noexcept;

  /// @brief The single request primitive of the remote control API
  /// @param method GET or POST
  /// @param path target path (including any query)
  /// @param authenticated attach the client token (when one is present)
  /// @param body request fields sent as a json object
  /// @param timeout override of the session timeout
  /// @return parsed reply, a null document for an empty reply
  /// @throws TransportError for a non-2xx status or a connection failure
  /// @throws ProtocolError for a malformed json reply
  JsonDoc request(Method method, csv path, bool authenticated,
                  const std::optional<Fields> &body = std::nullopt,
                  std::optional<Millis> timeout = std::nullopt);

  /// @brief Launch an app through DIAL (unauthenticated, token not required)
  /// @param app_name DIAL app name
  /// @return true when the device replies 201 Created
  /// @throws TransportError when no reply was received
  bool launch_app(csv app_name);

private:
  void assign_token(string tok) noexcept;

  Endpoint api_endpoint() const noexcept;
  Headers fixed_headers(csv content_type) const noexcept;

private:
  // order dependent
  const string host_addr;
  std::unique_ptr<Transport> transport;
  const Options opts;
  std::optional<string> client_token;

  // order independent
  mutable std::mutex mtx;

public:
  MOD_ID("remote.session");
};

} // namespace remote
} // namespace firemote
