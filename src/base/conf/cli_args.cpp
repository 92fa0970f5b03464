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


#include "base/conf/cli_args.hpp"
#include "base/conf/keys.hpp"
#include "base/conf/toml.hpp"
#include "base/types.hpp"
#include "build_inject.hpp"

#include <boost/program_options.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <vector>

namespace firemote {
namespace conf {

namespace po = boost::program_options;
namespace fs = std::filesystem;

using fs_path = fs::path;

constexpr auto def_timeout_secs{5};

constexpr auto desc_args{"command arguments"};
constexpr auto desc_cfg_file{"toml configuration file"};
constexpr auto desc_command{"command to run (default: remote)"};
constexpr auto desc_help{"command line help"};
constexpr auto desc_host{"device address (skips discovery)"};
constexpr auto desc_log_file{"full path to log file"};
constexpr auto desc_name{"friendly name shown on the device while pairing (default: firemote)"};
constexpr auto desc_timeout{"discovery window in seconds (default: 5)"};
constexpr auto desc_token{"client token from a previous pairing"};
constexpr auto desc_verify_tls{"verify the device certificate against the system CA store"};
constexpr auto opt_help{"help,h"};

toml::table cli_args::ttable;
string cli_args::error_str;
bool cli_args::help_requested{false};
std::ostringstream cli_args::help_ss;

cli_args::cli_args(int argc, char **argv) noexcept {
  ttable.clear();
  error_str.clear();
  help_requested = false;

  // get some base info and place into toml table
  fs_path fs_arg0{argv[0]};
  ttable.emplace(key::app_name, fs_arg0.filename().string());

  po::options_description desc(fmt::format("{} {}", build::info.project, build::info.version));
  po::variables_map args;

  // notifiers populate the toml table only for options actually given (or defaulted)
  auto cfg_file_v = po::value<string>()->notifier(
      [](const string p) { ttable.insert_or_assign(key::cfg_file, p); });

  auto host_v = po::value<string>()->notifier(
      [](const string h) { ttable.insert_or_assign(key::host, h); });

  auto token_v = po::value<string>()->notifier(
      [](const string t) { ttable.insert_or_assign(key::token, t); });

  // name and timeout have no program_options default so an absent option
  // leaves the configuration file value in effect
  auto name_v = po::value<string>()->notifier(
      [](const string n) { ttable.insert_or_assign(key::friendly_name, n); });

  auto timeout_v = po::value<int>()->notifier(
      [](int secs) { ttable.insert_or_assign(key::timeout, secs); });

  auto verify_tls_v = po::bool_switch()
                          ->notifier([](bool e) { ttable.insert_or_assign(key::verify_tls, e); })
                          ->default_value(false);

  auto log_file_v = po::value<string>()->notifier(
      [](const string f) { ttable.insert_or_assign(key::log_file, f); });

  auto help_v = po::bool_switch()
                    ->notifier([](bool e) { ttable.insert_or_assign(key::help, e); })
                    ->default_value(false);

  auto command_v = po::value<string>()->notifier(
      [](const string c) { ttable.insert_or_assign(key::command, c); });

  auto args_v = po::value<std::vector<string>>()->notifier([](const std::vector<string> &a) {
    toml::array arr;
    for (const auto &s : a) {
      arr.push_back(s);
    }

    ttable.insert_or_assign(key::args, std::move(arr));
  });

  desc.add_options()                                     //
      (key::host, host_v, desc_host)                     //
      (key::token, token_v, desc_token)                  //
      (key::friendly_name, name_v, desc_name)            //
      (key::timeout, timeout_v, desc_timeout)            //
      (key::verify_tls, verify_tls_v, desc_verify_tls)   //
      (key::cfg_file, cfg_file_v, desc_cfg_file)         //
      (key::log_file, log_file_v, desc_log_file)         //
      (opt_help, help_v, desc_help);                     //

  po::options_description hidden;
  hidden.add_options()                          //
      (key::command, command_v, desc_command)   //
      (key::args, args_v, desc_args);           //

  po::options_description all;
  all.add(desc).add(hidden);

  po::positional_options_description positional;
  positional.add(key::command, 1).add(key::args, -1);

  try {
    // this will throw if parsing fails
    auto parsed_opts =
        po::command_line_parser(argc, argv).options(all).positional(positional).run();

    // good, we parsed command line args, store them
    po::store(parsed_opts, args);

    // notify all args (populate toml table)
    po::notify(args);

  } catch (const po::error &ex) {
    error_str = fmt::format("bad args: {}", ex.what());
  }

  if (ttable[key::help].value_or(false)) {
    help_requested = true;

    help_ss.str(string());
    help_ss << "usage: " << build::info.project << " [options] <command> [args]\n\n"
            << "commands:\n"
            << "  discover | pair | launch [app] | status | properties | capabilities\n"
            << "  keyboard | apps | key <name> | text <string>\n"
            << "  seek <forward|backward> [secs] [speed] | remote\n\n"
            << desc;
  }

  if (auto t = ttable[key::timeout].value_or(def_timeout_secs); t <= 0) {
    error_str = fmt::format("bad args: --timeout must be positive, got {}", t);
  }
}

} // namespace conf
} // namespace firemote
