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


#include "mdns/found.hpp"
#include "mdns/zservice.hpp"

#include <doctest/doctest.h>
#include <thread>
#include <vector>

using namespace firemote;
using namespace firemote::mdns;
using namespace std::chrono_literals;

namespace {

ZeroConf make_zc(const char *name, const char *address) {
  return ZeroConf(ZeroConf::Details{.hostname = "amazon-1234.local",
                                    .name_net = name,
                                    .address = address,
                                    .type = "_amzn-fireTv._tcp",
                                    .port = 8009,
                                    .protocol = "IPv4"});
}

} // namespace

TEST_CASE("Service type suffix is stripped from the advertised name") {
  CHECK(ZeroConf::strip_type("Living Room._amzn-fireTv._tcp.local.", "_amzn-fireTv._tcp") ==
        "Living Room");
  CHECK(ZeroConf::strip_type("Living Room", "_amzn-fireTv._tcp") == "Living Room");
  CHECK(ZeroConf::strip_type("Den._amzn-fireTv._tcp", "") == "Den._amzn-fireTv._tcp");
}

TEST_CASE("Resolved service becomes a device on the remote control port") {
  const auto zc = make_zc("Bedroom._amzn-fireTv._tcp.local.", "192.168.1.77");
  const auto dev = zc.device();

  CHECK(zc.name_short() == "Bedroom");
  CHECK(dev.name == "Bedroom");
  CHECK(dev.host == "192.168.1.77");
  CHECK(dev.port == remote::API_PORT);
  CHECK(fmt::format("{}", dev) == "Bedroom (192.168.1.77)");
}

TEST_CASE("Found ignores a service resolved more than once") {
  Found found;

  CHECK(found.add(make_zc("Den", "10.0.0.2")));
  CHECK_FALSE(found.add(make_zc("Den", "10.0.0.2")));
  CHECK(found.add(make_zc("Kitchen", "10.0.0.3")));

  const auto devices = found.devices();
  REQUIRE(devices.size() == 2);
  CHECK(devices[0].name == "Den");
  CHECK(devices[1].name == "Kitchen");
}

TEST_CASE("Pending devices are delivered once") {
  Found found;
  found.add(make_zc("Den", "10.0.0.2"));

  std::vector<string> seen;
  auto on_found = [&seen](const remote::Device &d) { seen.push_back(d.name); };

  found.deliver_pending(on_found);
  found.deliver_pending(on_found);

  CHECK(seen == std::vector<string>{"Den"});
}

TEST_CASE("Devices added from another thread are delivered on the caller's thread") {
  Found found;
  const auto caller = std::this_thread::get_id();

  std::vector<string> seen;
  bool same_thread = true;

  std::thread poller([&found]() {
    std::this_thread::sleep_for(20ms);
    found.add(make_zc("Den", "10.0.0.2"));
    std::this_thread::sleep_for(20ms);
    found.add(make_zc("Office", "10.0.0.4"));
  });

  found.deliver_until(Found::clock::now() + 300ms, [&](const remote::Device &d) {
    same_thread = same_thread && (std::this_thread::get_id() == caller);
    seen.push_back(d.name);
  });

  poller.join();

  CHECK(same_thread);
  CHECK(seen == std::vector<string>{"Den", "Office"});
}

TEST_CASE("Nothing found returns at the deadline") {
  Found found;
  const auto start = Found::clock::now();

  found.deliver_until(start + 50ms, nullptr);

  CHECK(Found::clock::now() - start >= 50ms);
  CHECK(found.devices().empty());
  CHECK_FALSE(found.failed());
}

TEST_CASE("Failure ends delivery before the deadline") {
  Found found;
  const auto start = Found::clock::now();

  std::thread poller([&found]() {
    std::this_thread::sleep_for(10ms);
    found.fail("daemon disconnected");
  });

  found.deliver_until(start + 5s, nullptr);
  poller.join();

  CHECK(Found::clock::now() - start < 5s);
  CHECK(found.failed());
  CHECK(found.reason() == "daemon disconnected");
}
