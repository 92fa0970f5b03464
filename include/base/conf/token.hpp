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

#include "base/conf/toml.hpp"
#include "base/types.hpp"
#include "base/uuid.hpp"

#include <chrono>
#include <concepts>
#include <fmt/format.h>
#include <type_traits>

namespace firemote {
namespace conf {

template <class T>
concept StringLike = std::convertible_to<T, std::string_view>;

template <typename T>
concept IsConfDefVal =
    IsDuration<T> || std::integral<T> || IsAnyOf<T, bool, double, string> || StringLike<T>;

class token {
  friend struct fmt::formatter<token>;

public:
  /// @brief Create a default token (does not point to a configuration)
  token() = default;

  /// @brief Create config token populated with the subtable of the
  ///        merged configuration rooted at the module id
  /// @param mid module_id (aka root)
  token(csv mid) noexcept;

  token(token &&other) = default;
  token &operator=(token &&) = default;

public:
  /// @brief Is the configuration provided by this token empty?
  /// @return boolean
  bool empty() const noexcept { return ttable.empty(); }

  /// @brief Direct access to configuration table managed by token
  ///        Use with caution for access to configuration not handled
  ///        by member functions (e.g. array)
  /// @return const reference to table
  const toml::table &table() const noexcept { return ttable; }

  /// @brief Retrieve a "timeout" value from the config specified as either:
  ///        timeout = 5 (seconds) or
  ///        timeout = { mins = 1, secs = 30, millis = 100 }
  /// @param p path to the parent of the timeout key (empty for module root)
  /// @param def_val default duration
  /// @return std::chrono::milliseconds
  template <typename DefValType>
    requires IsDuration<DefValType>
  Millis timeout_val(csv p, DefValType &&def_val) const noexcept {
    const auto path = p.empty() ? "timeout"_tpath : toml::path(p).append("timeout"sv);
    const auto node = ttable.at_path(path);

    Millis sum_ms{0};

    if (node.is_table()) {
      node.as_table()->for_each([&sum_ms](const toml::key &key, auto &&val) {
        if constexpr (toml::is_integer<decltype(val)>) {
          const int64_t v = val.get();

          if ((key == "minutes"sv) || (key == "mins"sv)) {
            sum_ms += Minutes{v};
          } else if ((key == "seconds"sv) || (key == "secs"sv)) {
            sum_ms += Seconds{v};
          } else if ((key == "millis"sv) || (key == "ms"sv)) {
            sum_ms += Millis{v};
          }
        }
      });
    } else if (node.is_integer()) {
      sum_ms = Seconds{node.value_or(int64_t{0})};
    } else {
      sum_ms = std::chrono::duration_cast<Millis>(def_val);
    }

    return sum_ms;
  }

  /// @brief Retrieve configuration value located at path
  /// @tparam T Desired type of the returned value
  /// @param p Path to value, excluding root (a.k.a. module_id)
  /// @param def_val Default value if no value found at specified path
  ///                Default value is converted to T
  /// @return value of type T at specified path or provided default value
  template <typename T, typename D>
    requires IsConfDefVal<std::remove_cvref_t<D>>
  T val(csv p, D &&def_val) const noexcept {
    const auto node = ttable.at_path(p);

    if constexpr (std::same_as<T, string>) {
      return node.value_or(string(def_val));
    } else if constexpr (std::same_as<T, bool>) {
      return node.value_or(static_cast<bool>(def_val));
    } else if constexpr (std::integral<T>) {
      return static_cast<T>(node.value_or(static_cast<int64_t>(def_val)));
    } else if constexpr (std::floating_point<T>) {
      return static_cast<T>(node.value_or(static_cast<double>(def_val)));
    } else {
      static_assert(AlwaysFalse<T>, "unsupported configuration type");
    }
  }

protected:
  UUID uuid;
  string root;
  toml::table ttable;

public:
  MOD_ID("conf.token");
};

} // namespace conf
} // namespace firemote

template <> struct fmt::formatter<firemote::conf::token> : fmt::formatter<std::string_view> {

  template <typename FormatContext>
  auto format(const firemote::conf::token &tok, FormatContext &ctx) const {
    std::string msg;
    auto w = std::back_inserter(msg);

    fmt::format_to(w, "root={} uuid={}", tok.root, tok.uuid);

    if (tok.ttable.empty()) {
      fmt::format_to(w, " **EMPTY**");
    } else {
      fmt::format_to(w, " size={}", tok.ttable.size());
    }

    return fmt::formatter<std::string_view>::format(msg, ctx);
  }
};
