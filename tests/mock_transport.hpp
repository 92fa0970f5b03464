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

#include "remote/error.hpp"
#include "remote/json.hpp"
#include "remote/session.hpp"
#include "remote/transport.hpp"

#include <deque>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace firemote {
namespace test {

/// @brief Scripted in-memory transport, records every request and answers
///        with queued replies (an acknowledgement when nothing is queued)
class MockTransport : public remote::Transport {
public:
  struct Exchange {
    remote::Endpoint ep;
    remote::Request req;
  };

  using Scripted = std::variant<remote::Reply, remote::TransportError>;

public:
  MockTransport &reply(unsigned status, string body = string()) {
    script.emplace_back(remote::Reply{.status = status, .body = std::move(body)});
    return *this;
  }

  MockTransport &ack() { return reply(200, R"({"description":"OK"})"); }
  MockTransport &nak() { return reply(200, R"({"description":"ERROR"})"); }

  MockTransport &fail(const string &what) {
    script.emplace_back(remote::TransportError(0, string(), what));
    return *this;
  }

  remote::Reply exchange(const remote::Endpoint &ep, const remote::Request &req) override {
    exchanges.push_back(Exchange{.ep = ep, .req = req});

    if (script.empty()) return remote::Reply{.status = 200, .body = R"({"description":"OK"})"};

    auto next = std::move(script.front());
    script.pop_front();

    if (auto *err = std::get_if<remote::TransportError>(&next); err) throw *err;

    return std::get<remote::Reply>(next);
  }

  /// @brief Parsed json body of the nth request
  remote::JsonDoc body(size_t n) const { return remote::json::parse(exchanges.at(n).req.body); }

  /// @brief A string field of the json body of the nth request
  string field(size_t n, csv key) const {
    const auto doc = body(n);
    return remote::json::text(doc[string(key)]);
  }

  /// @brief Value of a header of the nth request (empty when absent)
  string header(size_t n, csv name) const {
    const auto *val = exchanges.at(n).req.header(name);
    return val ? *val : string();
  }

  bool has_header(size_t n, csv name) const { return exchanges.at(n).req.header(name) != nullptr; }

public:
  std::vector<Exchange> exchanges;
  std::deque<Scripted> script;
};

struct Fixture {
  static constexpr csv host{"192.168.1.50"};

  explicit Fixture(std::optional<string> token = std::nullopt) {
    auto transport = std::make_unique<MockTransport>();
    mock = transport.get();

    session = std::make_unique<remote::Session>(
        string(host), std::move(transport),
        remote::Session::Options{.user_agent = "firemote/test"}, std::move(token));
  }

  MockTransport *mock{nullptr};
  std::unique_ptr<remote::Session> session;
};

} // namespace test
} // namespace firemote
