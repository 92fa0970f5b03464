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

#include "base/types.hpp"
#include "mdns/found.hpp"
#include "mdns/zservice.hpp"

#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/thread-watch.h>
#include <type_traits>

namespace firemote {
namespace mdns {

/// @brief Avahi client, service browser and threaded poll for one discovery.
///        Everything is released by the destructor.
class Ctx {
public:
  Ctx(const string &stype, Found &found) noexcept;
  ~Ctx() noexcept;

  Ctx(const Ctx &) = delete;
  Ctx &operator=(const Ctx &) = delete;

  /// @brief Reason the context could not be started (empty when running)
  const string &error() const noexcept { return err_msg; }

private:
  // avahi callbacks
  static void cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                        AvahiBrowserEvent event, ccs name, ccs type, ccs domain,
                        AvahiLookupResultFlags flags, void *d);
  static void cb_client(AvahiClient *client, AvahiClientState state, void *d);
  static void cb_resolve(AvahiServiceResolver *r, AvahiIfIndex interface, AvahiProtocol protocol,
                         AvahiResolverEvent event, ccs name, ccs type, ccs domain, ccs host_name,
                         const AvahiAddress *address, uint16_t port, AvahiStringList *txt,
                         AvahiLookupResultFlags flags, void *d);

  template <typename T> static string error_string(T t) {
    using U = std::remove_pointer_t<T>;

    if constexpr (std::is_same_v<U, AvahiClient>) {
      return string(avahi_strerror(avahi_client_errno(t)));
    } else if constexpr (std::is_same_v<U, AvahiServiceBrowser>) {
      return error_string(avahi_service_browser_get_client(t));
    } else if constexpr (std::is_same_v<U, AvahiServiceResolver>) {
      return error_string(avahi_service_resolver_get_client(t));
    } else {
      static_assert(AlwaysFalse<U>, "unhandled Avahi type");
    }
  }

private:
  // order dependent
  const string stype;
  Found &found;

  // order independent
  string err_msg;
  AvahiThreadedPoll *tpoll{nullptr};
  AvahiClient *client{nullptr};
  AvahiServiceBrowser *browser{nullptr};

public:
  MOD_ID("mdns.ctx");
};

} // namespace mdns
} // namespace firemote
