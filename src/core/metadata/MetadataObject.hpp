#pragma once
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/registry/AttributeRegistry.hpp"
#include "core/storage/BackendAdapters.hpp"
#include "core/tags/TagSync.hpp"
#include "core/value/Coercion.hpp"
#include "core/value/Value.hpp"

namespace filemeta {

// Per-file view over every registered attribute. Nothing is cached: each
// call reads the stores again, and each mutating call commits on its own.
class MetadataObject {
public:
  MetadataObject(std::string path,
                 Collaborators collaborators,
                 const AttributeRegistry& registry = AttributeRegistry::instance());

  const std::string& path() const { return path_; }

  // When set, date-times are returned as aware UTC instead of naive local time.
  bool tzAware() const { return tzAware_; }
  void setTzAware(bool flag) { tzAware_ = flag; }

  // Absent scalars come back null, absent lists empty.
  Value get(const std::string& attribute);

  // Null value clears. assumeUtc: naive date-times in `value` are UTC.
  void set(const std::string& attribute, const Value& value, bool assumeUtc = false);

  // Appends the elements of `values` (a list of the attribute's kind). With
  // update=true elements already present are skipped.
  void append(const std::string& attribute, const Value& values,
              bool update = false, bool assumeUtc = false);

  // Removes the first matching element; throws ValueNotFound when absent.
  // Tags match by name; pass the name as a String value.
  void remove(const std::string& attribute, const Value& element, bool assumeUtc = false);

  // Like remove() but absent is a no-op. Returns whether something was removed.
  bool discard(const std::string& attribute, const Value& element, bool assumeUtc = false);

  void clear(const std::string& attribute);

  // Lists: both become the union (a's order, then what b adds).
  // Scalars: a is overwritten with b's current value; b is untouched.
  void mirror(const std::string& a, const std::string& b);

  // Every attribute with a non-empty value, keyed by canonical name, plus
  // _version, _filename and _filepath. With all=true, extended attributes no
  // registered attribute owns are added too, base64 encoded under their raw key.
  nlohmann::json asDict(bool all = false);

  // Writes an extended attribute no registered attribute owns. Throws
  // TypeMismatch for a key that belongs to a registered attribute.
  void writeRawAttribute(const std::string& key, const Bytes& value);

  // Clears every writable attribute that holds a value; returns their names.
  // FinderInfo projections at 0/false count as unset here and in copyFrom().
  std::vector<std::string> wipe();

  // Copies every writable, non-empty attribute of `source` onto this file.
  std::vector<std::string> copyFrom(MetadataObject& source);

  std::vector<Tag> tags() { return get("tags").asTags(); }
  void setTags(const std::vector<Tag>& tags) { set("tags", Value::ofTags(tags)); }

private:
  CoercionOptions readOptions() const;
  // Read form used inside read-modify-write cycles: always absolute.
  CoercionOptions internalOptions(bool assumeUtc) const;

  BackendAdapter& adapter(Backend backend);
  std::optional<RawValue> readRaw(const BackendBinding& binding);

  Value readValue(const AttributeDescriptor& d, const CoercionOptions& o);
  void writeValue(const AttributeDescriptor& d, const Value& value, const CoercionOptions& o);
  void clearValue(const AttributeDescriptor& d, const CoercionOptions& o);
  // True when the projection is set or any non-FinderInfo binding stores something.
  bool holdsValue(const AttributeDescriptor& d, const CoercionOptions& o);
  bool isManagedKey(const std::string& xattrKey) const;
  bool removeElement(const AttributeDescriptor& d, const Value& element, bool strict,
                     bool assumeUtc);

  // Executes the plan in order; aggregates failures into PartialWriteFailure.
  void commit(const AttributeDescriptor& d, const std::vector<BindingWrite>& plan);

  std::string path_;
  Collaborators collaborators_;
  const AttributeRegistry& registry_;
  bool tzAware_ = false;
  std::array<std::unique_ptr<BackendAdapter>, 5> adapters_;
};

} // namespace filemeta
