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


#include "remote/json.hpp"
#include "remote/error.hpp"
#include "remote/wire.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace firemote {
namespace remote {
namespace json {

static constexpr size_t min_capacity{1024};
static constexpr size_t max_capacity{4 * 1024 * 1024};

JsonDoc parse(const string &body) {
  if (body.empty()) return JsonDoc(0);

  // the document copies strings out of the body, start generously and
  // grow when the pool runs out
  auto capacity = std::max(min_capacity, body.size() * 3);

  for (;;) {
    JsonDoc doc(capacity);

    const auto err = deserializeJson(doc, body);

    if (!err) return doc;

    if ((err == DeserializationError::NoMemory) && (capacity < max_capacity)) {
      capacity *= 2;
      continue;
    }

    throw ProtocolError(fmt::format("malformed json reply: {}", err.c_str()));
  }
}

string serialize(const Fields &fields) noexcept {
  auto capacity = JSON_OBJECT_SIZE(fields.size());

  for (const auto &[key, val] : fields) {
    capacity += key.size() + val.size() + 2;
  }

  JsonDoc doc(capacity);
  auto obj = doc.to<JsonObject>();

  for (const auto &[key, val] : fields) {
    obj[key] = val;
  }

  string out;
  serializeJson(doc, out);

  return out;
}

string text(JsonVariantConst v) noexcept {
  if (v.isNull()) return string();
  if (v.is<const char *>()) return string(v.as<const char *>());

  string out;
  serializeJson(v, out);

  return out;
}

string description(const JsonDoc &doc) noexcept {
  return text(doc[wire::key_description.data()]);
}

Snapshot snapshot(const JsonDoc &doc) {
  Snapshot snap;

  if (doc.isNull()) return snap;

  if (!doc.is<JsonObjectConst>()) throw ProtocolError("expected a json object");

  for (JsonPairConst kv : doc.as<JsonObjectConst>()) {
    snap.insert_or_assign(kv.key().c_str(), text(kv.value()));
  }

  return snap;
}

DeviceProperties properties(const JsonDoc &doc) {
  if (doc.isNull()) return DeviceProperties();

  if (!doc.is<JsonObjectConst>()) throw ProtocolError("properties: expected a json object");

  auto obj = doc.as<JsonObjectConst>();

  return DeviceProperties{.os_version = text(obj["osVersion"]),
                          .platform_type = text(obj["platformType"]),
                          .turnstile_version = text(obj["turnstileVersion"]),
                          .epg_support = text(obj["epgSupport"]),
                          .power_support = text(obj["powerSupport"]),
                          .volume_support = text(obj["volumeSupport"]),
                          .pfm = text(obj["pfm"])};
}

Apps apps(const JsonDoc &doc) {
  Apps list;

  if (doc.isNull()) return list;

  if (!doc.is<JsonArrayConst>()) throw ProtocolError("apps: expected a json array");

  for (JsonVariantConst v : doc.as<JsonArrayConst>()) {
    if (!v.is<JsonObjectConst>()) throw ProtocolError("apps: expected an array of objects");

    auto obj = v.as<JsonObjectConst>();

    list.emplace_back(App{.app_id = text(obj["appId"]),
                          .name = text(obj["name"]),
                          .is_installed = obj["isInstalled"] | false,
                          .is_shortcut = obj["isShortcutApp"] | false,
                          .icon_url = text(obj["tvIconArt"]),
                          .launch_intent = text(obj["appShortcutLaunchIntent"])});
  }

  return list;
}

} // namespace json
} // namespace remote
} // namespace firemote
