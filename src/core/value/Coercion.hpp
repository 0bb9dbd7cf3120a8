#pragma once
#include <optional>

#include <nlohmann/json.hpp>

#include "core/registry/AttributeDescriptor.hpp"
#include "core/storage/Primitives.hpp"
#include "core/value/Value.hpp"

namespace filemeta {

struct CoercionOptions {
  // Naive date-times supplied by the caller are UTC instead of local time.
  bool assumeUtc = false;
  // Date-times read back are aware UTC instead of naive local time.
  bool tzAware = false;
};

// Finder accepts at most this many bytes in a comment.
constexpr std::size_t kMaxFinderComment = 750;

// Backend representation -> canonical value. Absent maps to Value::emptyOf(kind).
Value decode(const BackendBinding& binding, ValueKind kind,
             const std::optional<RawValue>& raw, const CoercionOptions& options);

// Canonical value -> backend representation. `prior` is the current raw value
// and is only consulted for FinderInfo bindings (read-modify-write).
RawValue encode(const BackendBinding& binding, ValueKind kind, const Value& value,
                const CoercionOptions& options, const std::optional<RawValue>& prior);

// Binary property encoding of extended-attribute payloads (CBOR).
Bytes encodeProperty(const nlohmann::json& value);
nlohmann::json decodeProperty(const Bytes& bytes);

// Serialized form used by backups and asDict(). Null maps to json null.
nlohmann::json toJson(const Value& value);
// Throws TypeMismatch when json does not have the shape of `kind`.
Value fromJson(const nlohmann::json& json, ValueKind kind);

// "name\ncolor" as stored in _kMDItemUserTags.
std::string formatUserTag(const Tag& tag);
Tag parseUserTag(const std::string& stored);

} // namespace filemeta
