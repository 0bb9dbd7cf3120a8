#include "MetadataObject.hpp"

#include <exception>
#include <filesystem>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "core/Version.hpp"
#include "core/errors/Errors.hpp"
#include "core/util/Base64.hpp"

namespace filemeta {

namespace {

std::string micros_key(const DateTime& dt, bool assumeUtc) {
  return std::to_string(toUnixMicros(dt, assumeUtc));
}

// Order-preserving merge. With dedupe, elements whose key is already present
// (in base or earlier in extra) are skipped.
template <typename T, typename KeyFn>
std::vector<T> merge(const std::vector<T>& base, const std::vector<T>& extra,
                     bool dedupe, KeyFn key) {
  std::vector<T> out = base;
  std::unordered_set<std::string> seen;
  for (const auto& e : base) seen.insert(key(e));
  for (const auto& e : extra) {
    std::string k = key(e);
    if (dedupe && seen.count(k)) continue;
    seen.insert(k);
    out.push_back(e);
  }
  return out;
}

// StringList and TagList mirror each other through tag names.
std::vector<Tag> as_tags(const Value& v) {
  if (v.kind() == ValueKind::TagList) return v.asTags();
  std::vector<Tag> out;
  for (const auto& s : v.asStringList()) out.push_back(Tag{s, kColorNone});
  return out;
}

Value from_tags(ValueKind kind, const std::vector<Tag>& tags) {
  if (kind == ValueKind::TagList) return Value::ofTags(tags);
  std::vector<std::string> names;
  for (const auto& t : tags) names.push_back(t.name);
  return Value::ofStringList(std::move(names));
}

bool name_compatible(ValueKind k) {
  return k == ValueKind::StringList || k == ValueKind::TagList;
}

// A FinderInfo projection at 0/false is what clearing leaves behind.
bool is_cleared(const AttributeDescriptor& d, const Value& v) {
  if (v.isEmpty()) return true;
  if (d.bindings.empty() || d.bindings.front().backend != Backend::LegacyBinaryRecord) {
    return false;
  }
  return v == Value::ofInteger(kColorNone) || v == Value::ofBoolean(false);
}

} // namespace

MetadataObject::MetadataObject(std::string path,
                               Collaborators collaborators,
                               const AttributeRegistry& registry)
  : path_(std::move(path)),
    collaborators_(std::move(collaborators)),
    registry_(registry) {}

// ---------- plumbing ----------

CoercionOptions MetadataObject::readOptions() const {
  CoercionOptions o;
  o.tzAware = tzAware_;
  return o;
}

CoercionOptions MetadataObject::internalOptions(bool assumeUtc) const {
  CoercionOptions o;
  o.assumeUtc = assumeUtc;
  o.tzAware = true;
  return o;
}

BackendAdapter& MetadataObject::adapter(Backend backend) {
  auto& slot = adapters_[static_cast<size_t>(backend)];
  if (!slot) slot = makeAdapter(backend, collaborators_, path_);
  return *slot;
}

std::optional<RawValue> MetadataObject::readRaw(const BackendBinding& binding) {
  return adapter(binding.backend).read(binding.physicalKey);
}

void MetadataObject::commit(const AttributeDescriptor& d, const std::vector<BindingWrite>& plan) {
  std::vector<std::string> succeeded;
  std::vector<BindingFailure> failed;
  std::exception_ptr firstError;

  for (const auto& w : plan) {
    const std::string label = w.binding->label();
    try {
      auto& a = adapter(w.binding->backend);
      if (w.value) {
        a.write(w.binding->physicalKey, *w.value);
      } else {
        a.remove(w.binding->physicalKey);
      }
      succeeded.push_back(label);
    } catch (const std::exception& e) {
      spdlog::warn("{}: write to {} failed: {}", d.canonicalName, label, e.what());
      failed.push_back({label, e.what()});
      if (!firstError) firstError = std::current_exception();
    }
  }

  if (failed.empty()) return;
  if (succeeded.empty() && failed.size() == 1) std::rethrow_exception(firstError);
  throw PartialWriteFailure(d.canonicalName, std::move(succeeded), std::move(failed));
}

// ---------- reads ----------

Value MetadataObject::readValue(const AttributeDescriptor& d, const CoercionOptions& o) {
  if (d.isTagLike()) {
    TagSync sync(d);
    auto rawOf = [this](const BackendBinding* b) -> std::optional<RawValue> {
      if (!b || !b->readCapable) return std::nullopt;
      return readRaw(*b);
    };
    return Value::ofTags(sync.reconcile(rawOf(sync.userTagsBinding()),
                                        rawOf(sync.tagNamesBinding()),
                                        rawOf(sync.finderInfoBinding()), o));
  }

  for (const auto& b : d.bindings) {
    if (!b.readCapable) continue;
    auto raw = readRaw(b);
    if (raw) return decode(b, d.kind, raw, o);
  }
  return Value::emptyOf(d.kind);
}

Value MetadataObject::get(const std::string& attribute) {
  return readValue(registry_.resolve(attribute), readOptions());
}

// ---------- writes ----------

void MetadataObject::writeValue(const AttributeDescriptor& d, const Value& value,
                                const CoercionOptions& o) {
  if (value.isNull()) {
    clearValue(d, o);
    return;
  }
  requireKind(value, d.kind, d.canonicalName);
  if (!d.isWritable()) throw ReadOnlyAttribute(d.canonicalName + " is read-only");

  // Everything is encoded before the first write so a bad value changes nothing.
  std::vector<BindingWrite> plan;
  if (d.isTagLike()) {
    TagSync sync(d);
    auto tags = TagSync::normalize(value.asTags());
    std::optional<RawValue> finderInfo;
    if (auto* fi = sync.finderInfoBinding()) finderInfo = readRaw(*fi);
    plan = sync.planSet(tags, finderInfo, o);
  } else {
    for (const auto& b : d.bindings) {
      if (!b.writeCapable) continue;
      std::optional<RawValue> prior;
      if (b.backend == Backend::LegacyBinaryRecord) prior = readRaw(b);
      plan.push_back({&b, encode(b, d.kind, value, o, prior)});
    }
  }

  spdlog::debug("set {} on {} = {}", d.canonicalName, path_, describe(value));
  commit(d, plan);
}

void MetadataObject::clearValue(const AttributeDescriptor& d, const CoercionOptions& o) {
  if (!d.isWritable()) throw ReadOnlyAttribute(d.canonicalName + " is read-only");

  std::vector<BindingWrite> plan;
  if (d.isTagLike()) {
    TagSync sync(d);
    std::optional<RawValue> finderInfo;
    if (auto* fi = sync.finderInfoBinding()) finderInfo = readRaw(*fi);
    plan = sync.planClear(finderInfo, o);
  } else {
    for (const auto& b : d.bindings) {
      if (!b.writeCapable) continue;
      if (b.backend == Backend::LegacyBinaryRecord) {
        // the record is shared; only this attribute's bits are reset
        auto prior = readRaw(b);
        if (!prior) continue;
        Value zero = d.kind == ValueKind::Boolean ? Value::ofBoolean(false)
                                                  : Value::ofInteger(kColorNone);
        plan.push_back({&b, encode(b, d.kind, zero, o, prior)});
      } else {
        plan.push_back({&b, std::nullopt});
      }
    }
  }

  spdlog::debug("clear {} on {}", d.canonicalName, path_);
  commit(d, plan);
}

void MetadataObject::set(const std::string& attribute, const Value& value, bool assumeUtc) {
  writeValue(registry_.resolve(attribute), value, internalOptions(assumeUtc));
}

void MetadataObject::clear(const std::string& attribute) {
  clearValue(registry_.resolve(attribute), internalOptions(false));
}

// ---------- list operations ----------

void MetadataObject::append(const std::string& attribute, const Value& values,
                            bool update, bool assumeUtc) {
  const auto& d = registry_.resolve(attribute);
  if (!d.isList()) {
    throw TypeMismatch("append is only valid for list attributes, " + d.canonicalName +
                       " is a " + to_string(d.kind));
  }
  requireKind(values, d.kind, d.canonicalName);
  if (values.isEmpty()) return;

  const auto o = internalOptions(assumeUtc);
  Value current = readValue(d, o);
  Value merged;
  switch (d.kind) {
    case ValueKind::StringList:
      merged = Value::ofStringList(merge(current.asStringList(), values.asStringList(), update,
                                         [](const std::string& s) { return s; }));
      break;
    case ValueKind::DateTimeList:
      merged = Value::ofDateTimeList(merge(current.asDateTimeList(), values.asDateTimeList(),
                                           update, [&](const DateTime& dt) {
                                             return micros_key(dt, assumeUtc);
                                           }));
      break;
    default:
      // tag names are unique whatever `update` says; normalize() keeps the first
      merged = Value::ofTags(merge(current.asTags(), values.asTags(), update,
                                   [](const Tag& t) { return t.name; }));
      break;
  }
  writeValue(d, merged, o);
}

bool MetadataObject::removeElement(const AttributeDescriptor& d, const Value& element,
                                   bool strict, bool assumeUtc) {
  if (!d.isList()) {
    throw TypeMismatch("remove is only valid for list attributes, " + d.canonicalName +
                       " is a " + to_string(d.kind));
  }
  const auto o = internalOptions(assumeUtc);
  Value current = readValue(d, o);
  Value updated;
  bool found = false;

  switch (d.kind) {
    case ValueKind::StringList: {
      auto list = current.asStringList();
      const auto& target = element.asString();
      for (auto it = list.begin(); it != list.end(); ++it) {
        if (*it == target) { list.erase(it); found = true; break; }
      }
      updated = Value::ofStringList(std::move(list));
      break;
    }
    case ValueKind::DateTimeList: {
      auto list = current.asDateTimeList();
      const auto key = micros_key(element.asDateTime(), assumeUtc);
      for (auto it = list.begin(); it != list.end(); ++it) {
        if (micros_key(*it, assumeUtc) == key) { list.erase(it); found = true; break; }
      }
      updated = Value::ofDateTimeList(std::move(list));
      break;
    }
    default: {
      auto list = current.asTags();
      // color plays no part in matching
      const std::string name = element.kind() == ValueKind::TagList && element.asTags().size() == 1
                                   ? element.asTags().front().name
                                   : element.asString();
      for (auto it = list.begin(); it != list.end(); ++it) {
        if (it->name == name) { list.erase(it); found = true; break; }
      }
      updated = Value::ofTags(std::move(list));
      break;
    }
  }

  if (!found) {
    if (strict) {
      throw ValueNotFound(describe(element) + " not found in " + d.canonicalName);
    }
    return false;
  }
  writeValue(d, updated, o);
  return true;
}

void MetadataObject::remove(const std::string& attribute, const Value& element, bool assumeUtc) {
  removeElement(registry_.resolve(attribute), element, true, assumeUtc);
}

bool MetadataObject::discard(const std::string& attribute, const Value& element, bool assumeUtc) {
  return removeElement(registry_.resolve(attribute), element, false, assumeUtc);
}

// ---------- mirror ----------

void MetadataObject::mirror(const std::string& a, const std::string& b) {
  const auto& da = registry_.resolve(a);
  const auto& db = registry_.resolve(b);
  if (&da == &db) {
    throw TypeMismatch("cannot mirror an attribute onto itself: " + da.canonicalName);
  }

  const auto o = internalOptions(false);
  if (!da.isList() && !db.isList()) {
    if (da.kind != db.kind) {
      throw TypeMismatch("cannot mirror " + da.canonicalName + ", " + db.canonicalName +
                         ": incompatible types");
    }
    // one-shot copy of b's current value into a
    writeValue(da, readValue(db, o), o);
    return;
  }

  const bool compatible =
      da.isList() && db.isList() &&
      (da.kind == db.kind || (name_compatible(da.kind) && name_compatible(db.kind)));
  if (!compatible) {
    throw TypeMismatch("cannot mirror " + da.canonicalName + ", " + db.canonicalName +
                       ": incompatible types");
  }

  Value va = readValue(da, o);
  Value vb = readValue(db, o);
  if (da.kind == ValueKind::DateTimeList) {
    auto key = [](const DateTime& dt) { return micros_key(dt, false); };
    Value u = Value::ofDateTimeList(merge(va.asDateTimeList(), vb.asDateTimeList(), true, key));
    writeValue(da, u, o);
    writeValue(db, u, o);
    return;
  }

  auto united = merge(as_tags(va), as_tags(vb), true, [](const Tag& t) { return t.name; });
  writeValue(da, from_tags(da.kind, united), o);
  writeValue(db, from_tags(db.kind, united), o);
}

// ---------- whole-file operations ----------

bool MetadataObject::isManagedKey(const std::string& xattrKey) const {
  for (const auto& d : registry_.all()) {
    for (const auto& b : d.bindings) {
      if (b.backend != Backend::ExtendedAttributeStore &&
          b.backend != Backend::LegacyBinaryRecord) continue;
      if (b.physicalKey == xattrKey) return true;
    }
  }
  return false;
}

void MetadataObject::writeRawAttribute(const std::string& key, const Bytes& value) {
  if (isManagedKey(key)) {
    throw TypeMismatch("extended attribute " + key + " belongs to a registered attribute");
  }
  if (!collaborators_.xattr) throw StorageError("no xattr primitive configured for " + path_);
  collaborators_.xattr->write(path_, key, value);
}

nlohmann::json MetadataObject::asDict(bool all) {
  nlohmann::json dict = {
    {"_version", kVersion},
    {"_filepath", path_},
    {"_filename", std::filesystem::path(path_).filename().string()}
  };
  const auto o = readOptions();
  for (const auto& d : registry_.all()) {
    if (!d.isReadable()) continue;
    Value v = readValue(d, o);
    if (!v.isEmpty()) dict[d.canonicalName] = toJson(v);
  }
  if (!all) return dict;

  if (!collaborators_.xattr) throw StorageError("no xattr primitive configured for " + path_);
  for (const auto& key : collaborators_.xattr->list(path_)) {
    if (isManagedKey(key)) continue;
    auto raw = collaborators_.xattr->read(path_, key);
    if (!raw) continue;  // removed since listing
    dict[key] = encodeBase64(*raw);
  }
  return dict;
}

bool MetadataObject::holdsValue(const AttributeDescriptor& d, const CoercionOptions& o) {
  if (!is_cleared(d, readValue(d, o))) return true;
  // a zeroed FinderInfo projection can hide a value still held by a later binding
  for (const auto& b : d.bindings) {
    if (!b.readCapable || b.backend == Backend::LegacyBinaryRecord) continue;
    if (readRaw(b)) return true;
  }
  return false;
}

std::vector<std::string> MetadataObject::wipe() {
  std::vector<std::string> wiped;
  const auto o = internalOptions(false);
  for (const auto& d : registry_.all()) {
    if (!d.isWritable() || !d.isReadable()) continue;
    if (!holdsValue(d, o)) continue;
    clearValue(d, o);
    wiped.push_back(d.canonicalName);
  }
  return wiped;
}

std::vector<std::string> MetadataObject::copyFrom(MetadataObject& source) {
  std::vector<std::string> copied;
  const auto o = internalOptions(false);
  for (const auto& d : registry_.all()) {
    if (!d.isWritable() || !d.isReadable()) continue;
    Value v = source.readValue(d, o);
    if (is_cleared(d, v)) continue;
    writeValue(d, v, o);
    copied.push_back(d.canonicalName);
  }
  return copied;
}

} // namespace filemeta
