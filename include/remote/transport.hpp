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

#include <fmt/format.h>
#include <utility>
#include <vector>

namespace firemote {
namespace remote {

enum class Scheme : uint8_t { Http = 0, Https };

/// @brief How the device certificate is treated during the TLS handshake
///        AcceptAny: any certificate (devices present a self-signed one)
///        Verify:    system CA store, peer verification and SNI
enum class TrustPolicy : uint8_t { AcceptAny = 0, Verify };

enum class Method : uint8_t { Get = 0, Post };

using Headers = std::vector<std::pair<string, string>>;

struct Endpoint {
  Scheme scheme{Scheme::Https};
  string host;
  Port port{0};
  TrustPolicy trust{TrustPolicy::AcceptAny};
};

struct Request {
  Method method{Method::Get};
  string target;
  Headers headers;
  string body;
  Millis timeout{5000};

  /// @brief Find a header by (lower case) name
  /// @return pointer to the value or nullptr
  const string *header(csv name) const noexcept {
    for (const auto &[key, val] : headers) {
      if (key == name) return &val;
    }

    return nullptr;
  }
};

struct Reply {
  unsigned status{0};
  string body;
};

/// @brief Performs one HTTP exchange with a device
class Transport {
public:
  virtual ~Transport() = default;

  /// @brief Send the request and wait for the complete reply
  ///        (connection, TLS and timeout failures throw TransportError
  ///        with status 0, any HTTP status is returned)
  virtual Reply exchange(const Endpoint &ep, const Request &req) = 0;
};

} // namespace remote
} // namespace firemote

template <> struct fmt::formatter<firemote::remote::Endpoint> : fmt::formatter<std::string_view> {

  template <typename FormatContext>
  auto format(const firemote::remote::Endpoint &ep, FormatContext &ctx) const {
    const auto scheme = (ep.scheme == firemote::remote::Scheme::Https) ? "https" : "http";

    return fmt::format_to(ctx.out(), "{}://{}:{}", scheme, ep.host, ep.port);
  }
};
