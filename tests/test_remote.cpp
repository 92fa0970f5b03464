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
#include "remote/remote.hpp"

#include <doctest/doctest.h>
#include <functional>
#include <vector>

using namespace firemote;
using namespace firemote::remote;
using firemote::test::Fixture;

TEST_CASE("Every operation requires a token and sends nothing without one") {
  Fixture fx;
  Remote remote(*fx.session);

  const std::vector<std::function<void()>> ops{
      [&] { remote.up(); },
      [&] { remote.down(); },
      [&] { remote.left(); },
      [&] { remote.right(); },
      [&] { remote.select(); },
      [&] { remote.back(); },
      [&] { remote.home(); },
      [&] { remote.menu(); },
      [&] { remote.play_pause(); },
      [&] { remote.send_text("abc"); },
      [&] { remote.send_char("a"); },
      [&] { remote.seek(ScanDirection::Forward); },
      [&] { remote.fast_forward(); },
      [&] { remote.rewind(); },
      [&] { remote.status(); },
      [&] { remote.properties(); },
      [&] { remote.capabilities(); },
      [&] { remote.apps(); },
      [&] { remote.keyboard_state(); },
      [&] { remote.launch_app(); }};

  for (const auto &op : ops) {
    CHECK_THROWS_AS(op(), AuthenticationRequired);
  }

  CHECK(fx.mock->exchanges.empty());
}

TEST_CASE("Navigation sends key down then key up to the action path") {
  struct Case {
    std::function<bool(Remote &)> op;
    string target;
  };

  const std::vector<Case> cases{
      {[](Remote &r) { return r.up(); }, "/v1/FireTV?action=dpad_up"},
      {[](Remote &r) { return r.down(); }, "/v1/FireTV?action=dpad_down"},
      {[](Remote &r) { return r.left(); }, "/v1/FireTV?action=dpad_left"},
      {[](Remote &r) { return r.right(); }, "/v1/FireTV?action=dpad_right"},
      {[](Remote &r) { return r.select(); }, "/v1/FireTV?action=select"}};

  for (const auto &c : cases) {
    Fixture fx("tok");
    Remote remote(*fx.session);

    CAPTURE(c.target);
    CHECK(c.op(remote));

    REQUIRE(fx.mock->exchanges.size() == 2);
    CHECK(fx.mock->exchanges[0].req.target == c.target);
    CHECK(fx.mock->exchanges[1].req.target == c.target);
    CHECK(fx.mock->exchanges[0].req.method == Method::Post);
    CHECK(fx.mock->field(0, "keyActionType") == "keyDown");
    CHECK(fx.mock->field(1, "keyActionType") == "keyUp");
    CHECK(fx.mock->header(0, "x-client-token") == "tok");
  }
}

TEST_CASE("Navigation result is the key up acknowledgement") {
  Fixture fx("tok");
  fx.mock->ack().nak();

  Remote remote(*fx.session);

  CHECK_FALSE(remote.up());
  CHECK(fx.mock->exchanges.size() == 2);
}

TEST_CASE("A failed key down still releases the key") {
  Fixture fx("tok");
  fx.mock->fail("reset by peer").ack();

  Remote remote(*fx.session);

  CHECK(remote.select());
  REQUIRE(fx.mock->exchanges.size() == 2);
  CHECK(fx.mock->field(1, "keyActionType") == "keyUp");
}

TEST_CASE("A malformed key down reply still releases the key") {
  Fixture fx("tok");
  fx.mock->reply(200, "<html>").ack();

  Remote remote(*fx.session);

  CHECK(remote.up());
  REQUIRE(fx.mock->exchanges.size() == 2);
  CHECK(fx.mock->field(0, "keyActionType") == "keyDown");
  CHECK(fx.mock->field(1, "keyActionType") == "keyUp");
}

TEST_CASE("A rejected key down still releases the key") {
  Fixture fx("tok");
  fx.mock->reply(500, "busy").ack();

  Remote remote(*fx.session);

  CHECK(remote.left());
  CHECK(fx.mock->exchanges.size() == 2);
}

TEST_CASE("Buttons are a single request without a body") {
  Fixture fx("tok");
  Remote remote(*fx.session);

  CHECK(remote.back());
  CHECK(remote.home());
  CHECK(remote.menu());

  REQUIRE(fx.mock->exchanges.size() == 3);
  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV?action=back");
  CHECK(fx.mock->exchanges[1].req.target == "/v1/FireTV?action=home");
  CHECK(fx.mock->exchanges[2].req.target == "/v1/FireTV?action=menu");

  for (const auto &ex : fx.mock->exchanges) {
    CHECK(ex.req.body.empty());
  }
}

TEST_CASE("Play pause posts to the media endpoint") {
  Fixture fx("tok");
  fx.mock->nak();

  Remote remote(*fx.session);

  CHECK_FALSE(remote.play_pause());
  CHECK(fx.mock->exchanges[0].req.target == "/v1/media?action=play");
  CHECK(fx.mock->exchanges[0].req.method == Method::Post);
}

TEST_CASE("Text is sent one character per request") {
  Fixture fx("tok");
  Remote remote(*fx.session);

  CHECK(remote.send_text("hi"));

  REQUIRE(fx.mock->exchanges.size() == 2);
  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV/text");
  CHECK(fx.mock->field(0, "text") == "h");
  CHECK(fx.mock->field(1, "text") == "i");
}

TEST_CASE("Text stops at the first character not acknowledged") {
  Fixture fx("tok");
  fx.mock->ack().nak();

  Remote remote(*fx.session);

  CHECK_FALSE(remote.send_text("abcd"));
  CHECK(fx.mock->exchanges.size() == 2);
}

TEST_CASE("Text splits multi-byte characters whole") {
  Fixture fx("tok");
  Remote remote(*fx.session);

  CHECK(remote.send_text("né€"));

  REQUIRE(fx.mock->exchanges.size() == 3);
  CHECK(fx.mock->field(0, "text") == "n");
  CHECK(fx.mock->field(1, "text") == "é");
  CHECK(fx.mock->field(2, "text") == "€");
}

TEST_CASE("Empty text sends nothing and succeeds") {
  Fixture fx("tok");
  Remote remote(*fx.session);

  CHECK(remote.send_text(""));
  CHECK(fx.mock->exchanges.empty());
}

TEST_CASE("Text transport failure propagates") {
  Fixture fx("tok");
  fx.mock->ack().fail("timeout");

  Remote remote(*fx.session);

  CHECK_THROWS_AS(remote.send_text("xyz"), TransportError);
  CHECK(fx.mock->exchanges.size() == 2);
}

TEST_CASE("Seek sends direction, duration and speed as strings") {
  Fixture fx("tok");
  Remote remote(*fx.session);

  CHECK(remote.seek(ScanDirection::Backward, 15, 2));

  CHECK(fx.mock->exchanges[0].req.target == "/v1/media?action=scan");

  const auto doc = fx.mock->body(0);
  CHECK(doc["direction"].as<string>() == "backward");
  CHECK(doc["durationInSeconds"].is<const char *>());
  CHECK(doc["durationInSeconds"].as<string>() == "15");
  CHECK(doc["speed"].as<string>() == "2");
}

TEST_CASE("Fast forward and rewind use the default duration and speed") {
  Fixture fx("tok");
  Remote remote(*fx.session);

  CHECK(remote.fast_forward());
  CHECK(remote.rewind(30));

  CHECK(fx.mock->field(0, "direction") == "forward");
  CHECK(fx.mock->field(0, "durationInSeconds") == "10");
  CHECK(fx.mock->field(0, "speed") == "1");
  CHECK(fx.mock->field(1, "direction") == "backward");
  CHECK(fx.mock->field(1, "durationInSeconds") == "30");
}

TEST_CASE("Status and capabilities return the reply as a snapshot") {
  Fixture fx("tok");
  fx.mock->reply(200, R"({"screenOn":true,"volume":7,"app":"com.example"})")
      .reply(200, R"({"voice":"yes"})");

  Remote remote(*fx.session);

  const auto st = remote.status();
  CHECK(fx.mock->exchanges[0].req.method == Method::Get);
  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV/status");
  CHECK(st.at("screenOn") == "true");
  CHECK(st.at("volume") == "7");
  CHECK(st.at("app") == "com.example");

  const auto caps = remote.capabilities();
  CHECK(fx.mock->exchanges[1].req.target == "/v1/FireTV2");
  CHECK(caps.at("voice") == "yes");
}

TEST_CASE("Properties map the device fields, missing ones are empty") {
  Fixture fx("tok");
  fx.mock->reply(200, R"({"osVersion":"7.6.2","platformType":"fire_tv","pfm":"UK"})");

  Remote remote(*fx.session);
  const auto props = remote.properties();

  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV/properties");
  CHECK(props.os_version == "7.6.2");
  CHECK(props.platform_type == "fire_tv");
  CHECK(props.pfm == "UK");
  CHECK(props.turnstile_version.empty());
  CHECK(props.volume_support.empty());
}

TEST_CASE("Apps map each entry of the reply array") {
  Fixture fx("tok");
  fx.mock->reply(200, R"([
    {"appId":"com.netflix","name":"Netflix","isInstalled":true,"tvIconArt":"http://x/n.png"},
    {"appId":"com.short","name":"Shortcut","isShortcutApp":true,
     "appShortcutLaunchIntent":"intent://launch"}
  ])");

  Remote remote(*fx.session);
  const auto apps = remote.apps();

  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV/appsV2");
  REQUIRE(apps.size() == 2);

  CHECK(apps[0].app_id == "com.netflix");
  CHECK(apps[0].name == "Netflix");
  CHECK(apps[0].is_installed);
  CHECK_FALSE(apps[0].is_shortcut);
  CHECK(apps[0].icon_url == "http://x/n.png");

  CHECK_FALSE(apps[1].is_installed);
  CHECK(apps[1].is_shortcut);
  CHECK(apps[1].launch_intent == "intent://launch");
}

TEST_CASE("Apps reply that is not an array is a protocol error") {
  Fixture fx("tok");
  fx.mock->reply(200, R"({"apps":[]})");

  Remote remote(*fx.session);

  CHECK_THROWS_AS(remote.apps(), ProtocolError);
}

TEST_CASE("Keyboard state is read from the keyboard endpoint") {
  Fixture fx("tok");
  fx.mock->reply(200, R"({"keyboardVisible":false})");

  Remote remote(*fx.session);

  CHECK(remote.keyboard_state().at("keyboardVisible") == "false");
  CHECK(fx.mock->exchanges[0].req.target == "/v1/FireTV/keyboard");
}

TEST_CASE("Launch app goes through DIAL with the default app") {
  Fixture fx("tok");
  fx.mock->reply(201);

  Remote remote(*fx.session);

  CHECK(remote.launch_app());
  CHECK(fx.mock->exchanges[0].req.target == "/apps/FireTVRemote");
  CHECK(fx.mock->exchanges[0].ep.port == 8009);
}
