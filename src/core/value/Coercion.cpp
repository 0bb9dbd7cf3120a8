#include "Coercion.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/finderinfo/FinderInfoCodec.hpp"

using nlohmann::json;

namespace filemeta {

namespace {

constexpr const char* kDateField = "$date";
constexpr std::uint64_t kInt64Max = static_cast<std::uint64_t>(INT64_MAX);

[[noreturn]] void shape_error(const BackendBinding& b, ValueKind kind, const json& j) {
  throw TypeMismatch(b.label() + ": stored value " + j.dump() + " is not a " + to_string(kind));
}

const Bytes& as_bytes(const BackendBinding& b, const RawValue& raw) {
  if (auto* p = std::get_if<Bytes>(&raw)) return *p;
  throw TypeMismatch(b.label() + ": expected a byte payload");
}

const json& as_json(const BackendBinding& b, const RawValue& raw) {
  if (auto* p = std::get_if<json>(&raw)) return *p;
  throw TypeMismatch(b.label() + ": expected a structured value");
}

// Single values are sometimes stored as a one-element list.
const json& unwrap_single(const json& j) {
  if (j.is_array() && j.size() == 1) return j[0];
  return j;
}

// ---------- dates ----------

// Normalizes an absolute instant to the read form the caller asked for.
DateTime read_form(std::int64_t micros, const CoercionOptions& o) {
  return fromUnixMicros(micros, o.tzAware);
}

std::string iso_utc(const DateTime& dt, const CoercionOptions& o) {
  return formatIsoDateTime(fromUnixMicros(toUnixMicros(dt, o.assumeUtc), true));
}

DateTime date_from_iso_text(const BackendBinding& b, const json& j, const CoercionOptions& o) {
  if (!j.is_string()) shape_error(b, ValueKind::DateTime, j);
  // naive strings in a store are taken as UTC, the store keeps absolute times
  DateTime stored = parseIsoDateTime(j.get<std::string>());
  return read_form(toUnixMicros(stored, true), o);
}

json date_to_native(const DateTime& dt, const CoercionOptions& o) {
  return json{{kDateField, toUnixMicros(dt, o.assumeUtc)}};
}

DateTime date_from_native(const BackendBinding& b, const json& j, const CoercionOptions& o) {
  if (j.is_object() && j.contains(kDateField) && j[kDateField].is_number_integer()) {
    return read_form(j[kDateField].get<std::int64_t>(), o);
  }
  if (j.is_string()) return date_from_iso_text(b, j, o);
  shape_error(b, ValueKind::DateTime, j);
}

// ---------- element helpers ----------

std::string string_of(const BackendBinding& b, const json& j) {
  if (!j.is_string()) shape_error(b, ValueKind::String, j);
  return j.get<std::string>();
}

std::vector<std::string> string_list_of(const BackendBinding& b, const json& j) {
  if (j.is_string()) return {j.get<std::string>()};
  if (!j.is_array()) shape_error(b, ValueKind::StringList, j);
  std::vector<std::string> out;
  for (const auto& e : j) out.push_back(string_of(b, e));
  return out;
}

std::int64_t integer_of(const BackendBinding& b, const json& j) {
  if (j.is_number_unsigned() && j.get<std::uint64_t>() > kInt64Max) {
    shape_error(b, ValueKind::Integer, j);
  }
  if (j.is_number_integer()) return j.get<std::int64_t>();
  if (j.is_number_float()) {
    double d = j.get<double>();
    // [-2^63, 2^63); NaN fails both comparisons
    if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
      auto i = static_cast<std::int64_t>(d);
      if (static_cast<double>(i) == d) return i;
    }
  }
  if (j.is_boolean()) return j.get<bool>() ? 1 : 0;
  shape_error(b, ValueKind::Integer, j);
}

bool boolean_of(const BackendBinding& b, const json& j) {
  if (j.is_boolean()) return j.get<bool>();
  if (j.is_number_integer()) return j.get<std::int64_t>() != 0;
  shape_error(b, ValueKind::Boolean, j);
}

// ---------- per-backend decode ----------

Value decode_json(const BackendBinding& b, ValueKind kind, const json& j,
                  const CoercionOptions& o, bool xattrForm) {
  if (j.is_null()) return Value::emptyOf(kind);
  auto date = [&](const json& e) {
    return xattrForm ? date_from_iso_text(b, e, o) : date_from_native(b, e, o);
  };

  switch (kind) {
    case ValueKind::String:
      return Value::ofString(string_of(b, unwrap_single(j)));
    case ValueKind::StringList:
      return Value::ofStringList(string_list_of(b, j));
    case ValueKind::Integer:
      return Value::ofInteger(integer_of(b, unwrap_single(j)));
    case ValueKind::Boolean:
      return Value::ofBoolean(boolean_of(b, unwrap_single(j)));
    case ValueKind::DateTime:
      return Value::ofDateTime(date(unwrap_single(j)));
    case ValueKind::DateTimeList: {
      std::vector<DateTime> out;
      if (j.is_array()) {
        for (const auto& e : j) out.push_back(date(e));
      } else {
        out.push_back(date(j));
      }
      return Value::ofDateTimeList(std::move(out));
    }
    case ValueKind::TagList: {
      std::vector<Tag> out;
      for (const auto& s : string_list_of(b, j)) {
        // the extended attribute carries colors, the resource store only names
        out.push_back(xattrForm ? parseUserTag(s) : Tag{s, kColorNone});
      }
      return Value::ofTags(std::move(out));
    }
  }
  shape_error(b, kind, j);
}

Value decode_legacy(const BackendBinding& b, ValueKind kind, const Bytes& bytes) {
  FinderInfoRecord rec = toFinderInfoRecord(bytes);
  if (b.legacyField == LegacyField::Color && kind == ValueKind::Integer) {
    return Value::ofInteger(decode_color(rec));
  }
  if (b.legacyField == LegacyField::Stationery && kind == ValueKind::Boolean) {
    return Value::ofBoolean(decode_stationery(rec));
  }
  if (b.legacyField == LegacyField::Color && kind == ValueKind::TagList) {
    // tags are reconciled by TagSync; a lone color has no name here
    return Value::ofTags({});
  }
  throw TypeMismatch(b.label() + ": cannot project FinderInfo as " + to_string(kind));
}

// ---------- per-backend encode ----------

json encode_json(const BackendBinding& b, ValueKind kind, const Value& v,
                 const CoercionOptions& o, bool xattrForm) {
  requireKind(v, kind, b.label());
  auto date = [&](const DateTime& dt) -> json {
    return xattrForm ? json(iso_utc(dt, o)) : date_to_native(dt, o);
  };

  switch (kind) {
    case ValueKind::String:     return v.asString();
    case ValueKind::StringList: return v.asStringList();
    case ValueKind::Integer:    return v.asInteger();
    case ValueKind::Boolean:    return v.asBoolean();
    case ValueKind::DateTime:   return date(v.asDateTime());
    case ValueKind::DateTimeList: {
      json arr = json::array();
      for (const auto& dt : v.asDateTimeList()) arr.push_back(date(dt));
      return arr;
    }
    case ValueKind::TagList: {
      json arr = json::array();
      for (const auto& t : v.asTags()) arr.push_back(xattrForm ? formatUserTag(t) : t.name);
      return arr;
    }
  }
  throw TypeMismatch(b.label() + ": unsupported kind");
}

Bytes encode_legacy(const BackendBinding& b, ValueKind kind, const Value& v,
                    const std::optional<RawValue>& prior) {
  std::optional<Bytes> priorBytes;
  if (prior) priorBytes = as_bytes(b, *prior);
  FinderInfoRecord rec = recordOrTemplate(priorBytes);

  if (b.legacyField == LegacyField::Color && kind == ValueKind::Integer) {
    const std::int64_t color = v.asInteger();
    if (color < kColorNone || color > kMaxColor) {
      throw TypeMismatch("color must be in range 0 to 7: " + std::to_string(color));
    }
    return toBytes(encode_color(rec, static_cast<int>(color)));
  }
  if (b.legacyField == LegacyField::Stationery && kind == ValueKind::Boolean) {
    return toBytes(encode_stationery(rec, v.asBoolean()));
  }
  throw TypeMismatch(b.label() + ": cannot store " + to_string(kind) + " in FinderInfo");
}

} // namespace

// ---------- public API ----------

Bytes encodeProperty(const json& value) {
  return json::to_cbor(value);
}

json decodeProperty(const Bytes& bytes) {
  try {
    return json::from_cbor(bytes);
  } catch (const json::exception& e) {
    throw BinaryDecodeError(std::string("malformed property payload: ") + e.what());
  }
}

std::string formatUserTag(const Tag& tag) {
  return tag.name + "\n" + std::to_string(tag.color);
}

Tag parseUserTag(const std::string& stored) {
  auto nl = stored.find('\n');
  if (nl == std::string::npos) return Tag{stored, kColorNone};
  Tag t{stored.substr(0, nl), kColorNone};
  // some writers leave more than one color line; the first one counts
  std::string rest = stored.substr(nl + 1);
  std::string first = rest.substr(0, rest.find('\n'));
  if (first.size() == 1 && first[0] >= '0' && first[0] <= '7') {
    t.color = first[0] - '0';
  } else if (!first.empty()) {
    spdlog::debug("ignoring unreadable color '{}' on tag '{}'", first, t.name);
  }
  return t;
}

Value decode(const BackendBinding& binding, ValueKind kind,
             const std::optional<RawValue>& raw, const CoercionOptions& options) {
  if (!raw) return Value::emptyOf(kind);

  switch (binding.backend) {
    case Backend::ExtendedAttributeStore:
      return decode_json(binding, kind, decodeProperty(as_bytes(binding, *raw)), options, true);
    case Backend::LegacyBinaryRecord:
      return decode_legacy(binding, kind, as_bytes(binding, *raw));
    case Backend::MetadataItemStore:
    case Backend::ResourceKeyStore:
    case Backend::CommentChannel:
      return decode_json(binding, kind, as_json(binding, *raw), options, false);
  }
  throw TypeMismatch(binding.label() + ": unknown backend");
}

RawValue encode(const BackendBinding& binding, ValueKind kind, const Value& value,
                const CoercionOptions& options, const std::optional<RawValue>& prior) {
  if (value.isNull()) {
    throw TypeMismatch(binding.label() + ": cannot encode a null value");
  }
  switch (binding.backend) {
    case Backend::ExtendedAttributeStore:
      return encodeProperty(encode_json(binding, kind, value, options, true));
    case Backend::LegacyBinaryRecord:
      return encode_legacy(binding, kind, value, prior);
    case Backend::CommentChannel: {
      if (kind != ValueKind::String) {
        throw TypeMismatch(binding.label() + ": only strings can be sent as comments");
      }
      const std::string& s = value.asString();
      if (s.size() > kMaxFinderComment) {
        throw TypeMismatch("Finder comment is limited to " + std::to_string(kMaxFinderComment) +
                           " bytes, got " + std::to_string(s.size()));
      }
      return json(s);
    }
    case Backend::MetadataItemStore:
    case Backend::ResourceKeyStore:
      return encode_json(binding, kind, value, options, false);
  }
  throw TypeMismatch(binding.label() + ": unknown backend");
}

json toJson(const Value& value) {
  auto k = value.kind();
  if (!k) return nullptr;
  switch (*k) {
    case ValueKind::String:     return value.asString();
    case ValueKind::StringList: return value.asStringList();
    case ValueKind::Integer:    return value.asInteger();
    case ValueKind::Boolean:    return value.asBoolean();
    case ValueKind::DateTime:   return formatIsoDateTime(value.asDateTime());
    case ValueKind::DateTimeList: {
      json arr = json::array();
      for (const auto& dt : value.asDateTimeList()) arr.push_back(formatIsoDateTime(dt));
      return arr;
    }
    case ValueKind::TagList: {
      json arr = json::array();
      for (const auto& t : value.asTags()) arr.push_back(json::array({t.name, t.color}));
      return arr;
    }
  }
  return nullptr;
}

Value fromJson(const json& j, ValueKind kind) {
  if (j.is_null()) return Value::emptyOf(kind);
  auto fail = [&]() -> Value {
    throw TypeMismatch(std::string("expected ") + to_string(kind) + " but got " + j.dump());
  };
  auto date = [&](const json& e) {
    if (!e.is_string()) fail();
    return parseIsoDateTime(e.get<std::string>());
  };

  switch (kind) {
    case ValueKind::String:
      if (!j.is_string()) return fail();
      return Value::ofString(j.get<std::string>());
    case ValueKind::StringList: {
      if (!j.is_array()) return fail();
      std::vector<std::string> out;
      for (const auto& e : j) {
        if (!e.is_string()) return fail();
        out.push_back(e.get<std::string>());
      }
      return Value::ofStringList(std::move(out));
    }
    case ValueKind::Integer:
      if (!j.is_number_integer()) return fail();
      if (j.is_number_unsigned() && j.get<std::uint64_t>() > kInt64Max) return fail();
      return Value::ofInteger(j.get<std::int64_t>());
    case ValueKind::Boolean:
      if (!j.is_boolean()) return fail();
      return Value::ofBoolean(j.get<bool>());
    case ValueKind::DateTime:
      return Value::ofDateTime(date(j));
    case ValueKind::DateTimeList: {
      if (!j.is_array()) return fail();
      std::vector<DateTime> out;
      for (const auto& e : j) out.push_back(date(e));
      return Value::ofDateTimeList(std::move(out));
    }
    case ValueKind::TagList: {
      if (!j.is_array()) return fail();
      std::vector<Tag> out;
      for (const auto& e : j) {
        if (e.is_array() && e.size() == 2 && e[0].is_string() && e[1].is_number_integer()) {
          const auto color = e[1].get<std::int64_t>();
          if (color < kColorNone || color > kMaxColor) {
            throw TypeMismatch("tag color must be in range 0 to 7: " + e.dump());
          }
          out.push_back(Tag{e[0].get<std::string>(), static_cast<int>(color)});
        } else if (e.is_string()) {
          out.push_back(parseTag(e.get<std::string>()));
        } else {
          return fail();
        }
      }
      return Value::ofTags(std::move(out));
    }
  }
  return fail();
}

} // namespace filemeta
