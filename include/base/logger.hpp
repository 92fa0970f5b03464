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

#include "base/conf/token.hpp"
#include "base/elapsed.hpp"
#include "base/types.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <filesystem>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/os.h>
#include <memory>
#include <mutex>
#include <optional>

namespace firemote {

class Logger;

extern std::unique_ptr<Logger> _logger;

class Logger {

public:
  Logger(const std::optional<std::filesystem::path> &log_file) noexcept;
  Logger(const Logger &) = delete;
  Logger(Logger &&) = delete;

  ~Logger() noexcept;

  /// @brief Create the process wide logger
  /// @param log_file destination file, stdout when not provided
  /// @return raw pointer to the logger
  static Logger *create(const std::optional<std::filesystem::path> &log_file = std::nullopt) noexcept {
    _logger = std::make_unique<Logger>(log_file);

    return _logger.get();
  }

  void vinfo(csv mod_id, csv cat, fmt::string_view format, fmt::format_args args) noexcept {

    if (should_log(mod_id, cat)) {
      const auto runtime{std::chrono::duration_cast<millis_fp>(e.as<Nanos>())};

      const auto prefix = fmt::format(prefix_format,      //
                                      runtime,            // millis since app start
                                      width_ts,           // width of timestamp field
                                      width_ts_precision, // runtime + width and precision
                                      mod_id, width_mod,  // module_id + width
                                      cat, width_cat);    // category + width)

      auto msg = fmt::vformat(format, args);

      if (msg.empty() || (msg.back() != '\n')) msg.append("\n");

      std::scoped_lock lck(mtx);
      out.print("{} {}", prefix, msg);
      out.flush();
    }
  }

  bool should_log(csv mod, csv cat) const noexcept {

    if ((cat == csv{"info"}) || tokc.empty()) return true;

    // order of precedence:
    //  1. logger.<cat>       == boolean
    //  2. logger.<mod>       == boolean
    //  3. logger.<mod>.<cat> == boolean
    std::array paths{toml::path(cat), toml::path(mod), toml::path(mod).append(cat)};

    return std::all_of(paths.begin(), paths.end(), [&t = tokc.table()](const auto &p) {
      const auto node = t.at_path(p);

      return node.is_boolean() ? node.value_or(true) : true;
    });
  }

  static void shutdown() noexcept { _logger.reset(); }

  /// @brief Path actually written (stdout when the requested file is unusable)
  const string &destination() const noexcept { return dest; }

private:
  // order dependent
  conf::token tokc;
  const string dest;
  fmt::ostream out;

  // order independent
  std::mutex mtx;
  static Elapsed e;

public:
  // order independent
  static constexpr fmt::string_view prefix_format{"{:>{}.{}} {:<{}} {:<{}}"};
  static constexpr int width_cat{15};
  static constexpr int width_mod{18};
  static constexpr int width_ts_precision{1};
  static constexpr int width_ts{13};

public:
  MOD_ID("logger");
};

/// @brief Format and emit a log line when a logger exists
template <typename... Args>
inline void log_info(csv mod_id, csv cat, fmt::format_string<Args...> format, Args &&...args) {
  if (_logger) _logger->vinfo(mod_id, cat, format, fmt::make_format_args(args...));
}

#define INFO(__cat, format, ...) firemote::log_info(module_id, __cat, format, ##__VA_ARGS__)

#define INFO_AUTO_CAT(cat)                                                                         \
  static constexpr std::string_view fn_id { cat }

#define INFO_AUTO(format, ...) firemote::log_info(module_id, fn_id, format, ##__VA_ARGS__)

#define INFO_INIT(format, ...) firemote::log_info(module_id, "init"sv, format, ##__VA_ARGS__)

} // namespace firemote
