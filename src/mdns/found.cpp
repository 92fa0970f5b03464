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
#include "base/logger.hpp"

#include <algorithm>

namespace firemote {
namespace mdns {

bool Found::add(const ZeroConf &zc) noexcept {
  INFO_AUTO_CAT("add");

  auto dev = zc.device();

  {
    std::scoped_lock lck(mtx);

    auto known = std::any_of(all.begin(), all.end(),
                             [&dev](const auto &d) { return d.name == dev.name; });

    if (known) return false;

    all.push_back(dev);
    pending.push_back(std::move(dev));
  }

  cv.notify_all();

  INFO_AUTO("{}", zc.inspect());

  return true;
}

void Found::fail(string reason) noexcept {
  {
    std::scoped_lock lck(mtx);
    fail_reason = std::move(reason);
  }

  cv.notify_all();
}

void Found::deliver_until(clock::time_point deadline, const OnFound &on_found) {
  for (;;) {
    {
      std::unique_lock lck(mtx);

      cv.wait_until(lck, deadline, [this]() { return !pending.empty() || !fail_reason.empty(); });

      if (pending.empty() && (!fail_reason.empty() || (clock::now() >= deadline))) return;
    }

    deliver_pending(on_found);
  }
}

void Found::deliver_pending(const OnFound &on_found) {
  std::unique_lock lck(mtx);

  while (!pending.empty()) {
    auto dev = std::move(pending.front());
    pending.pop_front();

    // invoke the callback without holding the lock, the poll thread keeps adding
    lck.unlock();
    if (on_found) on_found(dev);
    lck.lock();
  }
}

remote::Devices Found::devices() const noexcept {
  std::scoped_lock lck(mtx);

  return all;
}

bool Found::failed() const noexcept {
  std::scoped_lock lck(mtx);

  return !fail_reason.empty();
}

string Found::reason() const noexcept {
  std::scoped_lock lck(mtx);

  return fail_reason;
}

} // namespace mdns
} // namespace firemote
