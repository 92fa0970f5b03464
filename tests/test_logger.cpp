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


#include "base/conf/master.hpp"
#include "base/logger.hpp"

#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace firemote;

namespace {

string slurp(const std::filesystem::path &p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();

  return ss.str();
}

} // namespace

TEST_CASE("Log lines go to the requested file") {
  REQUIRE(conf::master::init_from(""));

  const auto path = std::filesystem::temp_directory_path() / "firemote-test-logger.log";
  std::filesystem::remove(path);

  auto *logger = Logger::create(path);
  CHECK(logger->destination() == path.string());

  log_info("remote"sv, "request"sv, "status={}", 200);
  Logger::shutdown();

  const auto text = slurp(path);
  CHECK(text.find("START") != string::npos);
  CHECK(text.find("status=200") != string::npos);
  CHECK(text.find("STOP") != string::npos);

  std::filesystem::remove(path);
}

TEST_CASE("A log file that can not be opened falls back to stdout") {
  REQUIRE(conf::master::init_from(""));

  auto *logger = Logger::create(std::filesystem::path("/nonexistent-firemote-dir/sub/x.log"));

  CHECK(logger->destination() == "/dev/stdout");

  Logger::shutdown();
}

TEST_CASE("Categories disabled in the logger table are suppressed") {
  REQUIRE(conf::master::init_from(R"(
    [logger]
    chatty = false

    [logger.remote]
    request = false
  )"));

  const auto path = std::filesystem::temp_directory_path() / "firemote-test-filter.log";
  std::filesystem::remove(path);

  auto *logger = Logger::create(path);

  CHECK(logger->should_log("remote"sv, "info"sv));
  CHECK(logger->should_log("remote"sv, "navigate"sv));
  CHECK_FALSE(logger->should_log("remote"sv, "request"sv));
  CHECK_FALSE(logger->should_log("mdns"sv, "chatty"sv));

  log_info("remote"sv, "request"sv, "hidden line");
  log_info("remote"sv, "navigate"sv, "shown line");
  Logger::shutdown();

  const auto text = slurp(path);
  CHECK(text.find("hidden line") == string::npos);
  CHECK(text.find("shown line") != string::npos);

  std::filesystem::remove(path);
}
