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
#include "remote/pairing.hpp"

#include <doctest/doctest.h>

using namespace firemote;
using namespace firemote::remote;
using firemote::test::Fixture;

TEST_CASE("A session without a token starts unpaired") {
  Fixture fx;
  Pairing pairing(*fx.session);

  CHECK(pairing.state() == Pairing::State::Unpaired);
  CHECK_FALSE(fx.session->paired());
}

TEST_CASE("A session with a token starts paired") {
  Fixture fx("known-token");
  Pairing pairing(*fx.session);

  CHECK(pairing.state() == Pairing::State::Paired);
}

TEST_CASE("Full pairing flow assigns the token returned by the device") {
  Fixture fx;
  fx.mock->ack().reply(200, R"({"description":"a1b2c3d4e5f6"})");

  Pairing pairing(*fx.session);

  REQUIRE(pairing.request_pin("Living Room Remote"));
  CHECK(pairing.state() == Pairing::State::PinRequested);
  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV/pin/display");
  CHECK(fx.mock->field(0, "friendlyName") == "Living Room Remote");

  REQUIRE(pairing.verify_pin("1234"));
  CHECK(pairing.state() == Pairing::State::Paired);
  CHECK(fx.mock->exchanges[1].req.target == "/v1/FireTV/pin/verify");
  CHECK(fx.mock->field(1, "pin") == "1234");

  CHECK(fx.session->paired());
  CHECK(fx.session->token() == "a1b2c3d4e5f6");

  // pairing calls are never authenticated
  CHECK_FALSE(fx.mock->has_header(0, "x-client-token"));
  CHECK_FALSE(fx.mock->has_header(1, "x-client-token"));
}

TEST_CASE("Subsequent authenticated requests carry the new token") {
  Fixture fx;
  fx.mock->ack().reply(200, R"({"description":"fresh-token"})");

  Pairing pairing(*fx.session);
  pairing.request_pin("den");
  pairing.verify_pin("0000");

  fx.session->request(Method::Get, "/v1/FireTV/status", true);

  CHECK(fx.mock->header(2, "x-client-token") == "fresh-token");
}

TEST_CASE("PIN display not acknowledged leaves the state alone") {
  Fixture fx;
  fx.mock->nak();

  Pairing pairing(*fx.session);

  CHECK_FALSE(pairing.request_pin("den"));
  CHECK(pairing.state() == Pairing::State::Unpaired);
}

TEST_CASE("Rejected PIN keeps the pin requested state and no token") {
  Fixture fx;
  fx.mock->ack().reply(200, R"({"description":""})").reply(200, "{}");

  Pairing pairing(*fx.session);
  pairing.request_pin("den");

  CHECK_FALSE(pairing.verify_pin("9999"));
  CHECK(pairing.state() == Pairing::State::PinRequested);
  CHECK_FALSE(fx.session->paired());

  CHECK_FALSE(pairing.verify_pin("8888"));
  CHECK_FALSE(fx.session->paired());
}

TEST_CASE("Rejected PIN on a paired session keeps the existing token") {
  Fixture fx("old-token");
  fx.mock->reply(200, R"({"description":""})");

  Pairing pairing(*fx.session);

  CHECK_FALSE(pairing.verify_pin("1111"));
  CHECK(fx.session->token() == "old-token");
  CHECK(pairing.state() == Pairing::State::Paired);
}

TEST_CASE("Re-pairing replaces the token") {
  Fixture fx("old-token");
  fx.mock->ack().reply(200, R"({"description":"new-token"})");

  Pairing pairing(*fx.session);
  CHECK(pairing.request_pin("den"));
  CHECK(pairing.state() == Pairing::State::PinRequested);
  CHECK(fx.session->token() == "old-token");

  CHECK(pairing.verify_pin("4321"));
  CHECK(fx.session->token() == "new-token");
}

TEST_CASE("Transport failures during pairing propagate") {
  Fixture fx;
  fx.mock->fail("connection refused").reply(403, "forbidden");

  Pairing pairing(*fx.session);

  CHECK_THROWS_AS(pairing.request_pin("den"), TransportError);
  CHECK(pairing.state() == Pairing::State::Unpaired);

  CHECK_THROWS_AS(pairing.verify_pin("1234"), TransportError);
  CHECK_FALSE(fx.session->paired());
}

TEST_CASE("Pairing state renders for logging") {
  CHECK(fmt::format("{}", Pairing::State::Unpaired) == "unpaired");
  CHECK(fmt::format("{}", Pairing::State::PinRequested) == "pin_requested");
  CHECK(fmt::format("{}", Pairing::State::Paired) == "paired");
}
