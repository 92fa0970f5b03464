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


#include "app.hpp"
#include "base/conf/fixed.hpp"
#include "base/conf/keys.hpp"
#include "base/conf/master.hpp"
#include "base/conf/token.hpp"
#include "base/logger.hpp"
#include "mdns/mdns.hpp"
#include "remote/error.hpp"
#include "remote/pairing.hpp"
#include "remote/wire.hpp"
#include "term/keyboard.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <filesystem>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iostream>
#include <map>

namespace firemote {

namespace {

constexpr csv cmd_remote_name{"remote"};
constexpr int max_pin_attempts{3};

const auto cyan = fmt::fg(fmt::terminal_color::bright_cyan);
const auto green = fmt::fg(fmt::terminal_color::bright_green);
const auto red = fmt::fg(fmt::terminal_color::bright_red);
const auto yellow = fmt::fg(fmt::terminal_color::bright_yellow);
const auto bold = fmt::emphasis::bold;
const auto dim = fmt::emphasis::faint;

template <typename... Args> void error(fmt::format_string<Args...> format, Args &&...args) {
  fmt::print(red, "{}\n", fmt::format(format, std::forward<Args>(args)...));
}

std::optional<string> prompt(csv msg) {
  fmt::print(bold, "{}", msg);
  std::fflush(stdout);

  string line;
  if (!std::getline(std::cin, line)) return std::nullopt;

  return line;
}

std::optional<int> to_int(csv text) noexcept {
  int val{0};

  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), val);

  if ((ec != std::errc()) || (ptr != text.data() + text.size())) return std::nullopt;

  return val;
}

void print_snapshot(const remote::Snapshot &snap) {
  if (snap.empty()) {
    fmt::print(dim, "(empty)\n");
    return;
  }

  const auto width = std::max_element(snap.begin(), snap.end(), [](const auto &a, const auto &b) {
                       return a.first.size() < b.first.size();
                     })->first.size();

  for (const auto &[key, val] : snap) {
    fmt::print("  {:<{}}  {}\n", key, width, val);
  }
}

void print_apps(remote::Apps apps, bool installed_only) {
  std::sort(apps.begin(), apps.end(), [](const auto &a, const auto &b) { return a.name < b.name; });

  for (const auto &app : apps) {
    if (installed_only && !app.is_installed) continue;

    fmt::print("  {} {}{}\n", fmt::format(green, "*"), app.name,
               app.is_installed ? "" : " (not installed)");
    fmt::print(dim, "    {}\n", app.app_id);
  }
}

void print_controls() {
  static const std::array<std::pair<string_view, string_view>, 10> controls{{{"Arrows", "Navigate"},
                                                             {"Enter", "Select/OK"},
                                                             {"Backspace", "Back"},
                                                             {"H", "Home"},
                                                             {"M", "Menu"},
                                                             {"Space", "Play/Pause"},
                                                             {"< / >", "Rewind / Fast Forward"},
                                                             {"T", "Text input mode"},
                                                             {"A", "List apps"},
                                                             {"Q", "Quit"}}};

  fmt::print(bold, "Controls:\n");
  for (const auto &[key, desc] : controls) {
    fmt::print("  {} {}\n", fmt::format(yellow, "{:<10}", key), desc);
  }

  fmt::print("\n");
}

/// @brief Remote action bound to a key press
struct Binding {
  csv label;
  bool (*action)(remote::Remote &);
};

std::optional<Binding> binding_for(const term::KeyPress &kp) noexcept {
  using term::Key;

  switch (kp.key) {
  case Key::Up:
    return Binding{"Up", [](remote::Remote &r) { return r.up(); }};
  case Key::Down:
    return Binding{"Down", [](remote::Remote &r) { return r.down(); }};
  case Key::Left:
    return Binding{"Left", [](remote::Remote &r) { return r.left(); }};
  case Key::Right:
    return Binding{"Right", [](remote::Remote &r) { return r.right(); }};
  case Key::Enter:
    return Binding{"Select", [](remote::Remote &r) { return r.select(); }};
  case Key::Backspace:
    return Binding{"Back", [](remote::Remote &r) { return r.back(); }};
  case Key::Char:
    break;
  default:
    return std::nullopt;
  }

  switch (std::tolower(static_cast<unsigned char>(kp.ch))) {
  case 'h':
    return Binding{"Home", [](remote::Remote &r) { return r.home(); }};
  case 'm':
    return Binding{"Menu", [](remote::Remote &r) { return r.menu(); }};
  case ' ':
    return Binding{"Play/Pause", [](remote::Remote &r) { return r.play_pause(); }};
  case '<':
  case ',':
    return Binding{"Rewind", [](remote::Remote &r) { return r.rewind(); }};
  case '>':
  case '.':
    return Binding{"Fast Forward", [](remote::Remote &r) { return r.fast_forward(); }};
  default:
    return std::nullopt;
  }
}

std::filesystem::path default_log_file() noexcept {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);

  if (ec) dir = "/tmp";

  return dir / fmt::format("{}.log", conf::fixed::app_name());
}

} // namespace

App::App() noexcept : args(conf::fixed::args()), command(conf::fixed::command()) {
  if (command.empty()) command.assign(cmd_remote_name);
}

int App::main() {
  INFO_AUTO_CAT("main");

  const auto cfg_ok = conf::master::init();

  // the interactive remote keeps log lines off the terminal
  auto log_file = conf::fixed::log_file();
  if (!log_file && (command == cmd_remote_name)) log_file.emplace(default_log_file());

  Logger::create(log_file);

  INFO_INIT("{} {} command={} args={}", conf::fixed::app_name(), conf::fixed::app_version(),
            command, args);
  INFO_INIT("{}", conf::master::get_msg(conf::master::InitMsg));

  int rc{1};

  if (!cfg_ok) {
    error("configuration error: {}", conf::master::get_msg(conf::master::ParseMsg));
  } else {
    try {
      rc = dispatch();

    } catch (const remote::AuthenticationRequired &e) {
      error("{}, use --token <token> or run '{} pair'", e.what(), conf::fixed::app_name());
    } catch (const remote::TransportError &e) {
      INFO_AUTO("transport error status={} body={}", e.status(), e.body());
      error("request failed: {}", e.what());
    } catch (const remote::Error &e) {
      error("{}", e.what());
    }
  }

  INFO_AUTO("finished rc={}", rc);
  Logger::shutdown();

  return rc;
}

int App::dispatch() {
  static const std::map<string_view, int (App::*)()> commands{{"apps", &App::cmd_apps},
                                                       {"capabilities", &App::cmd_capabilities},
                                                       {"discover", &App::cmd_discover},
                                                       {"key", &App::cmd_key},
                                                       {"keyboard", &App::cmd_keyboard},
                                                       {"launch", &App::cmd_launch},
                                                       {"pair", &App::cmd_pair},
                                                       {"properties", &App::cmd_properties},
                                                       {cmd_remote_name, &App::cmd_remote},
                                                       {"seek", &App::cmd_seek},
                                                       {"status", &App::cmd_status},
                                                       {"text", &App::cmd_text}};

  if (auto it = commands.find(command); it != commands.end()) return (this->*it->second)();

  error("unknown command '{}', see --help", command);

  return 1;
}

int App::cmd_apps() {
  auto session = connect(false);
  if (!session) return 1;

  print_apps(remote::Remote(*session).apps(), false);

  return 0;
}

int App::cmd_capabilities() {
  auto session = connect(false);
  if (!session) return 1;

  print_snapshot(remote::Remote(*session).capabilities());

  return 0;
}

int App::cmd_discover() {
  mDNS mdns;

  fmt::print(cyan, "Searching for Fire TV devices...\n");

  const auto devices = mdns.discover(mdns.timeout(), [](const remote::Device &dev) {
    fmt::print(green, "  Found: {}\n", dev);
  });

  if (devices.empty()) {
    fmt::print(red, "\nNo Fire TV devices found.\n");
    fmt::print(dim, "Make sure your Fire TV is on and connected to the same network.\n");
  }

  return 0;
}

int App::cmd_key() {
  static const std::map<string_view, bool (remote::Remote::*)()> keys{
      {"back", &remote::Remote::back},     {"down", &remote::Remote::down},
      {"home", &remote::Remote::home},     {"left", &remote::Remote::left},
      {"menu", &remote::Remote::menu},     {"play", &remote::Remote::play_pause},
      {"right", &remote::Remote::right},   {"select", &remote::Remote::select},
      {"up", &remote::Remote::up}};

  if (args.empty()) {
    error("key requires a name: up, down, left, right, select, back, home, menu or play");
    return 1;
  }

  const auto it = keys.find(args.front());
  if (it == keys.end()) {
    error("unknown key '{}'", args.front());
    return 1;
  }

  auto session = connect(false);
  if (!session) return 1;

  remote::Remote r(*session);
  const auto ok = (r.*(it->second))();

  fmt::print(ok ? green : red, "{} {}\n", ok ? "ok" : "not acknowledged", args.front());

  return ok ? 0 : 1;
}

int App::cmd_keyboard() {
  auto session = connect(false);
  if (!session) return 1;

  print_snapshot(remote::Remote(*session).keyboard_state());

  return 0;
}

int App::cmd_launch() {
  const auto app_name =
      args.empty() ? conf::token(conf::root::remote).val<string>("dial_app"sv, remote::wire::dial_default_app)
                   : args.front();

  auto session = connect(false);
  if (!session) return 1;

  const auto launched = session->launch_app(app_name);

  if (launched) {
    fmt::print(green, "launched {}\n", app_name);
  } else {
    error("launch of {} was not accepted", app_name);
  }

  return launched ? 0 : 1;
}

int App::cmd_pair() {
  auto session = connect(false);
  if (!session) return 1;

  wake(*session);

  return pair(*session) ? 0 : 1;
}

int App::cmd_properties() {
  auto session = connect(false);
  if (!session) return 1;

  const auto props = remote::Remote(*session).properties();

  print_snapshot(remote::Snapshot{{"osVersion", props.os_version},
                                  {"platformType", props.platform_type},
                                  {"turnstileVersion", props.turnstile_version},
                                  {"epgSupport", props.epg_support},
                                  {"powerSupport", props.power_support},
                                  {"volumeSupport", props.volume_support},
                                  {"pfm", props.pfm}});

  return 0;
}

int App::cmd_remote() {
  fmt::print(bold | cyan, "\n        Fire TV Remote Control\n\n");

  auto session = connect(true);
  if (!session) return 1;

  if (!session->paired()) {
    fmt::print(yellow, "\nPairing required...\n");

    wake(*session);
    if (!pair(*session)) return 1;
  }

  interactive(*session);

  return 0;
}

int App::cmd_seek() {
  const auto direction = args.empty() ? std::nullopt : remote::wire::scan_direction(args[0]);

  if (!direction) {
    error("seek requires a direction: forward or backward");
    return 1;
  }

  const auto seconds = (args.size() > 1) ? to_int(args[1]) : remote::Remote::def_seek_secs;
  const auto speed = (args.size() > 2) ? to_int(args[2]) : remote::Remote::def_seek_speed;

  if (!seconds || !speed) {
    error("seek seconds and speed must be integers");
    return 1;
  }

  auto session = connect(false);
  if (!session) return 1;

  const auto ok = remote::Remote(*session).seek(*direction, *seconds, *speed);

  fmt::print(ok ? green : red, "seek {} {}s speed {}\n", args[0], *seconds, *speed);

  return ok ? 0 : 1;
}

int App::cmd_status() {
  auto session = connect(false);
  if (!session) return 1;

  print_snapshot(remote::Remote(*session).status());

  return 0;
}

int App::cmd_text() {
  if (args.empty()) {
    error("text requires the text to send");
    return 1;
  }

  auto session = connect(false);
  if (!session) return 1;

  const auto text = fmt::format("{}", fmt::join(args, " "));
  const auto ok = remote::Remote(*session).send_text(text);

  if (ok) {
    fmt::print(green, "Sent: {}\n", text);
  } else {
    error("Failed to send text.");
  }

  return ok ? 0 : 1;
}

std::unique_ptr<remote::Session> App::connect(bool choose) {
  INFO_AUTO_CAT("connect");

  if (auto host = conf::fixed::host(); host) {
    fmt::print(cyan, "Connecting to {}...\n", *host);

    return remote::Session::create(*host, conf::fixed::token());
  }

  mDNS mdns;
  fmt::print(cyan, "Searching for Fire TV devices...\n");

  const auto devices = mdns.discover(mdns.timeout(), [](const remote::Device &dev) {
    fmt::print(green, "  Found: {}\n", dev);
  });

  if (devices.empty()) {
    fmt::print(red, "\nNo Fire TV devices found.\n");
    fmt::print(dim, "Make sure your Fire TV is on and connected to the same network.\n");
    return nullptr;
  }

  const auto device = choose ? select_device(devices) : std::make_optional(devices.front());
  if (!device) return nullptr;

  INFO_AUTO("using {}", *device);
  fmt::print(cyan, "\nConnecting to {}...\n", device->name);

  return remote::Session::create(device->host, conf::fixed::token());
}

bool App::pair(remote::Session &session) {
  const auto friendly_name =
      conf::token(conf::root::remote).val<string>("friendly_name"sv, conf::fixed::app_name());

  remote::Pairing pairing(session);

  fmt::print(cyan, "Requesting PIN display on Fire TV...\n");

  if (!pairing.request_pin(friendly_name)) {
    error("Failed to request PIN display.");
    return false;
  }

  fmt::print(green, "PIN should now be displayed on your TV.\n");

  for (int attempt = 0; attempt < max_pin_attempts; ++attempt) {
    const auto pin = prompt("\nEnter the 4-digit PIN: ");
    if (!pin || pin->empty()) break;

    if (pairing.verify_pin(*pin)) {
      fmt::print(green, "Paired successfully!\n");
      fmt::print(dim, "Token: {}\n", session.token().value_or(string()));
      return true;
    }

    error("Invalid PIN. Please try again.");
  }

  return false;
}

void App::wake(remote::Session &session) {
  INFO_AUTO_CAT("wake");

  const auto app_name =
      conf::token(conf::root::remote).val<string>("dial_app"sv, remote::wire::dial_default_app);

  // pairing may still succeed when the service is already running
  try {
    const auto launched = session.launch_app(app_name);
    INFO_AUTO("{} launched={}", app_name, launched);
  } catch (const remote::TransportError &e) {
    INFO_AUTO("{} launch failed: {}", app_name, e.what());
  }
}

void App::interactive(remote::Session &session) {
  INFO_AUTO_CAT("interactive");

  remote::Remote r(session);
  term::Keyboard kb;

  const auto token = session.token().value_or(string());

  fmt::print(green, "\nConnected to: {}\n", session.host());
  fmt::print(dim, "Token: {}...\n\n", token.substr(0, 16));
  print_controls();
  fmt::print(bold, "Ready! Press keys to control your Fire TV.\n\n");

  for (;;) {
    const auto kp = kb.read(Millis(100));

    if (kp.key == term::Key::None) continue;

    const auto ch = std::tolower(static_cast<unsigned char>(kp.ch));

    if ((kp.key == term::Key::Interrupt) || ((kp.key == term::Key::Char) && (ch == 'q'))) {
      fmt::print(yellow, "\nGoodbye!\n");
      break;
    }

    if ((kp.key == term::Key::Char) && (ch == 't')) {
      fmt::print(yellow, "\nText Input Mode\n");
      fmt::print(dim, "Type text and press Enter to send. Press Enter on empty line to exit.\n");

      for (auto line = prompt("> "); line && !line->empty(); line = prompt("> ")) {
        try {
          if (r.send_text(*line)) {
            fmt::print(green, "Sent: {}\n", *line);
          } else {
            error("Failed to send text.");
          }
        } catch (const remote::Error &e) {
          error("Failed to send text: {}", e.what());
        }
      }

      fmt::print(dim, "Exiting text mode.\n");
      print_controls();
      continue;
    }

    if ((kp.key == term::Key::Char) && (ch == 'a')) {
      fmt::print(yellow, "\nInstalled Apps:\n");

      try {
        print_apps(r.apps(), true);
      } catch (const remote::Error &e) {
        error("Failed to list apps: {}", e.what());
      }

      continue;
    }

    const auto binding = binding_for(kp);
    if (!binding) continue;

    try {
      const auto ok = binding->action(r);

      const auto mark = ok ? fmt::format(green, "+") : fmt::format(red, "x");

      fmt::print("  {} {}\n", mark, binding->label);
    } catch (const remote::Error &e) {
      INFO_AUTO("{} failed: {}", binding->label, e.what());
      error("  x {} - Error: {}", binding->label, e.what());
    }
  }
}

std::optional<remote::Device> App::select_device(const remote::Devices &devices) {
  if (devices.size() == 1) return devices.front();

  fmt::print(bold, "\nSelect a device:\n");

  for (size_t i = 0; i < devices.size(); ++i) {
    fmt::print("  {} {}\n", fmt::format(yellow, "{}.", i + 1), devices[i]);
  }

  for (;;) {
    const auto choice = prompt(fmt::format("\nEnter number (1-{}): ", devices.size()));
    if (!choice) return std::nullopt;

    if (auto idx = to_int(*choice); idx && (*idx >= 1) && (*idx <= static_cast<int>(devices.size()))) {
      return devices[*idx - 1];
    }

    error("Invalid selection.");
  }
}

} // namespace firemote
