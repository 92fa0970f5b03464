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


#include "mdns/mdns_ctx.hpp"
#include "base/logger.hpp"

#include <array>
#include <avahi-common/address.h>
#include <fmt/format.h>

namespace firemote {
namespace mdns {

Ctx::Ctx(const string &stype, Found &found) noexcept
    : stype(stype), //
      found(found)  //
{
  INFO_AUTO_CAT("init");

  // CONSTRUCTOR DESIGN NOTES:
  //
  //  -allocates the client and browser before starting the poll thread so
  //   no locking is required here
  //  -the client callback may fire from within avahi_client_new()

  tpoll = avahi_threaded_poll_new();

  if (tpoll == nullptr) {
    err_msg.assign("failed to allocate threaded_poll");
    return;
  }

  int err{0};

  // no AVAHI_CLIENT_NO_FAIL, a missing daemon is reported immediately
  const AvahiClientFlags flags{};
  client = avahi_client_new(avahi_threaded_poll_get(tpoll), flags, Ctx::cb_client, this, &err);

  if (client == nullptr) {
    err_msg = fmt::format("client failed: {}", avahi_strerror(err));
    return;
  }

  browser = avahi_service_browser_new(client,              // client
                                      AVAHI_IF_UNSPEC,     // network interface
                                      AVAHI_PROTO_UNSPEC,  // any protocol
                                      stype.c_str(),       // service type
                                      nullptr,             // domain
                                      (AvahiLookupFlags)0, // lookup flags
                                      Ctx::cb_browse,      // callback
                                      this);               // userdata

  if (browser == nullptr) {
    err_msg = fmt::format("browse {} failed: {}", stype, error_string(client));
    return;
  }

  if (err = avahi_threaded_poll_start(tpoll); err < 0) {
    err_msg = fmt::format("poll start failed: {}", avahi_strerror(err));
    return;
  }

  INFO_AUTO("browsing for {}", stype);
}

Ctx::~Ctx() noexcept {
  // stop the poll thread first, callbacks reference this object
  if (tpoll) avahi_threaded_poll_stop(tpoll);

  // freeing the client also frees the browser and any pending resolvers
  if (client) avahi_client_free(client);
  if (tpoll) avahi_threaded_poll_free(tpoll);
}

void Ctx::cb_client(AvahiClient *client, AvahiClientState state, void *user_data) {
  INFO_AUTO_CAT("cb_client");

  auto ctx = static_cast<Ctx *>(user_data);

  switch (state) {
  case AVAHI_CLIENT_S_RUNNING: {
    INFO_AUTO("RUNNING, vsn='{}'", avahi_client_get_version_string(client));
  } break;

  case AVAHI_CLIENT_FAILURE: {
    const auto reason = error_string(client);

    INFO_AUTO("FAILED, reason={}", reason);
    ctx->found.fail(fmt::format("mdns client failed: {}", reason));
  } break;

  case AVAHI_CLIENT_CONNECTING:
  case AVAHI_CLIENT_S_REGISTERING:
  case AVAHI_CLIENT_S_COLLISION:
    break;
  }
}

void Ctx::cb_browse(AvahiServiceBrowser *b, AvahiIfIndex iface, AvahiProtocol protocol,
                    AvahiBrowserEvent event, ccs name, ccs type, ccs domain, AvahiLookupResultFlags,
                    void *user_data) { // static

  INFO_AUTO_CAT("cb_browse");

  auto ctx = static_cast<Ctx *>(user_data);

  switch (event) {
  case AVAHI_BROWSER_FAILURE: {
    const auto reason = error_string(b);

    INFO_AUTO("browser={} error={}", fmt::ptr(b), reason);
    ctx->found.fail(fmt::format("mdns browse failed: {}", reason));
  } break;

  case AVAHI_BROWSER_NEW: {
    INFO_AUTO("NEW {} {}", type, name);

    // default flags (for clarity)
    AvahiLookupFlags flags{};

    // resolve to an IPv4 address, the remote control API listens there
    auto r = avahi_service_resolver_new(avahi_service_browser_get_client(b), // the client
                                        iface,           // same interface
                                        protocol,        // same protocol
                                        name,            // same service name
                                        type,            // same service type
                                        domain,          // same domain
                                        AVAHI_PROTO_INET, // address protocol
                                        flags,           // resolve flags
                                        cb_resolve,      // callback when resolved
                                        user_data);      // same userdata (ctx)

    // the resolver is freed by cb_resolve or, when discovery ends first,
    // by avahi_client_free()
    if (!r) INFO_AUTO("RESOLVER failed, service={} reason={}", name, error_string(b));

  } break;

  case AVAHI_BROWSER_REMOVE:
  case AVAHI_BROWSER_ALL_FOR_NOW:
  case AVAHI_BROWSER_CACHE_EXHAUSTED:
    break;
  }
}

void Ctx::cb_resolve(AvahiServiceResolver *r, AvahiIfIndex, AvahiProtocol protocol,
                     AvahiResolverEvent event, ccs name, ccs type, ccs, ccs host_name,
                     const AvahiAddress *address, uint16_t port, AvahiStringList *,
                     AvahiLookupResultFlags, void *user_data) {
  INFO_AUTO_CAT("cb_resolve");

  auto ctx = static_cast<Ctx *>(user_data);

  switch (event) {
  case AVAHI_RESOLVER_FAILURE: {
    INFO_AUTO("FAILED, name={} reason={}", name, error_string(r));
  } break;

  case AVAHI_RESOLVER_FOUND: {
    std::array<char, AVAHI_ADDRESS_STR_MAX> addr_str{0};

    ctx->found.add(ZeroConf({
        .hostname = host_name,                                                       //
        .name_net = name,                                                            //
        .address = avahi_address_snprint(addr_str.data(), addr_str.size(), address), //
        .type = type,                                                                //
        .port = port,                                                                //
        .protocol = avahi_proto_to_string(protocol)                                  //
    }));
  } break;
  }

  if (r) avahi_service_resolver_free(r);
}

} // namespace mdns
} // namespace firemote
