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


#include "base/logger.hpp"
#include "base/conf/keys.hpp"

#include <system_error>

namespace firemote {
std::unique_ptr<Logger> _logger;

Elapsed Logger::e;

static constexpr auto flags{fmt::file::WRONLY | fmt::file::APPEND | fmt::file::CREATE};
static constexpr auto stdout_path{"/dev/stdout"};

// a log file that can not be opened falls back to stdout
static string usable_path(const std::optional<std::filesystem::path> &log_file) noexcept {
  if (!log_file) return string(stdout_path);

  try {
    fmt::output_file(log_file->string(), flags).close();

    return log_file->string();
  } catch (const std::system_error &e) {
    fmt::print(stderr, "log file {} unusable ({}), logging to stdout\n", log_file->string(),
               e.what());
  }

  return string(stdout_path);
}

Logger::Logger(const std::optional<std::filesystem::path> &log_file) noexcept
    : tokc(conf::root::logger),          //
      dest(usable_path(log_file)),       //
      out(fmt::output_file(dest, flags)) //
{
  const auto now = std::chrono::system_clock::now();
  out.print("\n{:%FT%H:%M:%S} START\n", now);
  out.flush();
}

Logger::~Logger() noexcept {
  const auto now = std::chrono::system_clock::now();
  out.print("\n{:%FT%H:%M:%S} STOP\n", now);
  out.close();
}

} // namespace firemote
