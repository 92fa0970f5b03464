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


#include "mock_transport.hpp"
#include "remote/error.hpp"
#include "remote/session.hpp"
#include "remote/wire.hpp"

#include <doctest/doctest.h>
#include <set>

using namespace firemote;
using namespace firemote::remote;
using firemote::test::Fixture;

TEST_CASE("Request goes to the https api endpoint with the fixed headers") {
  Fixture fx("tok-123");

  const auto doc = fx.session->request(Method::Get, wire::path_status, true);

  REQUIRE(fx.mock->exchanges.size() == 1);
  const auto &ex = fx.mock->exchanges[0];

  CHECK(ex.ep.scheme == Scheme::Https);
  CHECK(ex.ep.host == "192.168.1.50");
  CHECK(ex.ep.port == 8080);
  CHECK(ex.ep.trust == TrustPolicy::AcceptAny);
  CHECK(ex.req.method == Method::Get);
  CHECK(ex.req.target == "/v1/FireTV/status");
  CHECK(ex.req.timeout == Millis(5000));

  CHECK(fx.mock->header(0, "content-type") == "application/json; charset=utf-8");
  CHECK(fx.mock->header(0, "accept") == "*/*");
  CHECK(fx.mock->header(0, "x-api-key") == "0987654321");
  CHECK(fx.mock->header(0, "user-agent") == "firemote/test");
  CHECK(fx.mock->header(0, "x-client-token") == "tok-123");
  CHECK(fx.mock->header(0, "x-amzn-request-id").size() == 36);

  CHECK(json::description(doc) == "OK");
}

TEST_CASE("Unauthenticated requests never carry the client token") {
  Fixture fx("tok-123");

  fx.session->request(Method::Post, wire::path_pin_display, false,
                      Fields{{"friendlyName", "den"}});

  CHECK_FALSE(fx.mock->has_header(0, "x-client-token"));
  CHECK(fx.mock->has_header(0, "x-amzn-request-id"));
  CHECK(fx.mock->field(0, "friendlyName") == "den");
}

TEST_CASE("Authenticated request without a token is sent without the token header") {
  Fixture fx;

  fx.session->request(Method::Get, wire::path_status, true);

  CHECK_FALSE(fx.mock->has_header(0, "x-client-token"));
}

TEST_CASE("Every request carries a distinct request id") {
  Fixture fx("tok");

  std::set<string> ids;
  for (int i = 0; i < 5; ++i) {
    fx.session->request(Method::Get, wire::path_status, true);
    ids.insert(fx.mock->header(i, "x-amzn-request-id"));
  }

  CHECK(ids.size() == 5);
}

TEST_CASE("Non-2xx replies raise TransportError with status and body") {
  Fixture fx("tok");
  fx.mock->reply(401, "unauthorized");

  try {
    fx.session->request(Method::Get, wire::path_status, true);
    FAIL("expected TransportError");
  } catch (const TransportError &e) {
    CHECK(e.status() == 401);
    CHECK(e.body() == "unauthorized");
  }
}

TEST_CASE("Connection failures propagate as TransportError with status 0") {
  Fixture fx("tok");
  fx.mock->fail("connect refused");

  try {
    fx.session->request(Method::Get, wire::path_status, true);
    FAIL("expected TransportError");
  } catch (const TransportError &e) {
    CHECK(e.status() == 0);
    CHECK(string(e.what()) == "connect refused");
  }
}

TEST_CASE("Malformed json raises ProtocolError, an empty body is a null document") {
  Fixture fx("tok");
  fx.mock->reply(200, "{not json").reply(204, "");

  CHECK_THROWS_AS(fx.session->request(Method::Get, wire::path_status, true), ProtocolError);

  const auto doc = fx.session->request(Method::Get, wire::path_status, true);
  CHECK(doc.isNull());
}

TEST_CASE("Request timeout can be overridden per call") {
  Fixture fx("tok");

  fx.session->request(Method::Get, wire::path_status, true, std::nullopt, Millis(750));

  CHECK(fx.mock->exchanges[0].req.timeout == Millis(750));
}

TEST_CASE("Requests without fields have an empty body") {
  Fixture fx("tok");

  fx.session->request(Method::Post, wire::path_media_play, true);

  CHECK(fx.mock->exchanges[0].req.method == Method::Post);
  CHECK(fx.mock->exchanges[0].req.body.empty());
}

TEST_CASE("DIAL launch posts to the dial port without authentication") {
  Fixture fx("tok");
  fx.mock->reply(201);

  CHECK(fx.session->launch_app("FireTVRemote"));

  const auto &ex = fx.mock->exchanges[0];
  CHECK(ex.ep.scheme == Scheme::Http);
  CHECK(ex.ep.port == 8009);
  CHECK(ex.req.method == Method::Post);
  CHECK(ex.req.target == "/apps/FireTVRemote");
  CHECK(ex.req.body.empty());
  CHECK(fx.mock->header(0, "content-type") == "text/plain");
  CHECK_FALSE(fx.mock->has_header(0, "x-client-token"));
}

TEST_CASE("DIAL launch is false for any status other than 201 and does not throw") {
  Fixture fx;
  fx.mock->reply(200).reply(404, "no such app").reply(503);

  CHECK_FALSE(fx.session->launch_app("FireTVRemote"));
  CHECK_FALSE(fx.session->launch_app("Missing"));
  CHECK_FALSE(fx.session->launch_app("FireTVRemote"));
  CHECK(fx.mock->exchanges.size() == 3);
}

TEST_CASE("Session built from a device uses the device port") {
  auto transport = std::make_unique<test::MockTransport>();
  auto *mock = transport.get();

  Session session(Device{.name = "Den", .host = "10.0.0.7", .port = 8443}, std::move(transport),
                  Session::Options());

  session.request(Method::Get, wire::path_status, true);

  CHECK(mock->exchanges[0].ep.host == "10.0.0.7");
  CHECK(mock->exchanges[0].ep.port == 8443);
  CHECK_FALSE(session.paired());
}

TEST_CASE("An empty token is treated as no token") {
  Fixture fx(string{});

  CHECK_FALSE(fx.session->paired());
  CHECK_FALSE(fx.session->token().has_value());

  fx.session->request(Method::Get, wire::path_status, true);

  CHECK_FALSE(fx.mock->has_header(0, "x-client-token"));
}
