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
#include "base/conf/cli_args.hpp"
#include "base/conf/toml.hpp"
#include "build_inject.hpp"

#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/std.h>

namespace firemote {
namespace conf {

namespace fs = std::filesystem;

toml::table master::ttable;
std::array<string, 2> master::msgs;

bool master::init() noexcept {
  msgs[ParseMsg].clear();
  ttable.clear();

  // build info is always available
  ttable.emplace(root::build, toml::table{{key::project, build::info.project},
                                          {key::version, build::info.version}});

  const auto &cli = cli_args::table();
  const bool explicit_file = cli.contains(key::cfg_file);

  fs::path cfg_file = explicit_file ? fs::path(cli[key::cfg_file].value_or(string()))
                                    : default_cfg_file();

  // a missing default file is fine, a missing explicit file is not
  if (fs::exists(cfg_file)) {
    auto pt_result = toml::parse_file(cfg_file.string());

    if (pt_result) {
      merge(ttable, pt_result.table());
    } else {
      msgs[ParseMsg] = fmt::format("{} parse failed: {}", cfg_file, pt_result.error().description());
    }

  } else if (explicit_file) {
    msgs[ParseMsg] = fmt::format("{}: not found", cfg_file);
  }

  apply_cli();

  msgs[InitMsg] = fmt::format("cfg_file={} table_size={}", cfg_file, ttable.size());

  return parse_ok();
}

bool master::init_from(csv raw) noexcept {
  msgs[ParseMsg].clear();
  ttable.clear();

  auto pt_result = toml::parse(raw);

  if (pt_result) {
    merge(ttable, pt_result.table());
  } else {
    msgs[ParseMsg] = fmt::format("parse failed: {}", pt_result.error().description());
  }

  return parse_ok();
}

void master::copy_to(csv root, toml::table &dest) noexcept {
  if (auto node = ttable[root]; node.is_table()) {
    dest = *node.as_table();
  } else {
    dest = toml::table();
  }
}

fs::path master::default_cfg_file() noexcept {
  fs::path base;

  if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    base = xdg;
  } else if (auto home = std::getenv("HOME"); home && *home) {
    base = fs::path(home) / ".config";
  } else {
    base = build::info.sysconf_dir;
  }

  return base / build::info.project / fmt::format("{}.toml", build::info.project);
}

void master::apply_cli() noexcept {
  const auto &cli = cli_args::table();

  ttable.insert_or_assign(root::cli, cli);

  auto ensure = [](csv root) -> toml::table & {
    if (!ttable[root].is_table()) ttable.insert_or_assign(root, toml::table());

    return *ttable[root].as_table();
  };

  // command line values override their configuration file counterparts
  if (cli[key::verify_tls].value_or(false)) {
    ensure(root::remote).insert_or_assign("verify_tls", true);
  }

  if (auto name = cli[key::friendly_name].value<string>(); name) {
    ensure(root::remote).insert_or_assign("friendly_name", *name);
  }

  if (auto secs = cli[key::timeout].value<int64_t>(); secs) {
    ensure(root::mdns).insert_or_assign("timeout", toml::table{{"secs", *secs}});
  }
}

void master::merge(toml::table &dest, const toml::table &src) noexcept {
  src.for_each([&dest](const toml::key &key, auto &&val) {
    using node_t = std::remove_cvref_t<decltype(val)>;

    if constexpr (std::is_same_v<node_t, toml::table>) {
      if (auto *existing = dest[key.str()].as_table(); existing) {
        merge(*existing, val);
        return;
      }
    }

    dest.insert_or_assign(key, val);
  });
}

} // namespace conf
} // namespace firemote
