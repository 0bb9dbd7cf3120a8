#include "BackendAdapters.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/finderinfo/FinderInfoCodec.hpp"

using nlohmann::json;

namespace filemeta {

namespace {

const Bytes& bytes_of(const RawValue& v, const char* who) {
  if (auto* b = std::get_if<Bytes>(&v)) return *b;
  throw TypeMismatch(std::string(who) + " stores byte payloads only");
}

const json& json_of(const RawValue& v, const char* who) {
  if (auto* j = std::get_if<json>(&v)) return *j;
  throw TypeMismatch(std::string(who) + " stores structured values only");
}

// AppleScript string literal.
std::string quote_applescript(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += "\"";
  return out;
}

template <typename T>
std::shared_ptr<T> require(const std::shared_ptr<T>& p, const char* what) {
  if (!p) throw std::invalid_argument(std::string("no ") + what + " configured");
  return p;
}

} // namespace

// ---------- ExtendedAttributeStore ----------

std::optional<RawValue> ExtendedAttributeStore::read(const std::string& key) {
  auto v = xattr_->read(path_, key);
  if (!v) return std::nullopt;
  return RawValue(std::move(*v));
}

void ExtendedAttributeStore::write(const std::string& key, const RawValue& value) {
  xattr_->write(path_, key, bytes_of(value, "ExtendedAttributeStore"));
}

void ExtendedAttributeStore::remove(const std::string& key) {
  xattr_->remove(path_, key);
}

// ---------- MetadataItemStore ----------

std::optional<RawValue> MetadataItemStore::read(const std::string& key) {
  auto v = items_->copyItemValue(path_, key);
  if (!v || v->is_null()) return std::nullopt;
  return RawValue(std::move(*v));
}

void MetadataItemStore::write(const std::string& key, const RawValue&) {
  throw ReadOnlyAttribute("metadata item " + key + " has no write path");
}

void MetadataItemStore::remove(const std::string& key) {
  throw ReadOnlyAttribute("metadata item " + key + " has no write path");
}

// ---------- ResourceKeyStore ----------

bool ResourceKeyStore::isWritableKey(const std::string& key) {
  return key == kTagNamesResourceKey || key == kLabelNumberKey || key == "NSURLIsHiddenKey";
}

std::optional<RawValue> ResourceKeyStore::read(const std::string& key) {
  auto v = resources_->getResourceValue(path_, key);
  if (!v || v->is_null()) return std::nullopt;
  return RawValue(std::move(*v));
}

void ResourceKeyStore::write(const std::string& key, const RawValue& value) {
  if (!isWritableKey(key)) throw ReadOnlyAttribute("resource key " + key + " is read-only");
  resources_->setResourceValue(path_, key, json_of(value, "ResourceKeyStore"));
}

void ResourceKeyStore::remove(const std::string& key) {
  if (!isWritableKey(key)) throw ReadOnlyAttribute("resource key " + key + " is read-only");
  resources_->setResourceValue(path_, key, nullptr);
}

// ---------- LegacyBinaryRecordStore ----------

std::optional<RawValue> LegacyBinaryRecordStore::read(const std::string& key) {
  auto v = xattr_->read(path_, key);
  if (!v) return std::nullopt;
  toFinderInfoRecord(*v); // length check
  return RawValue(std::move(*v));
}

void LegacyBinaryRecordStore::write(const std::string& key, const RawValue& value) {
  const Bytes& b = bytes_of(value, "LegacyBinaryRecord");
  toFinderInfoRecord(b);
  xattr_->write(path_, key, b);
}

void LegacyBinaryRecordStore::remove(const std::string& key) {
  xattr_->remove(path_, key);
}

// ---------- CommentChannel ----------

std::string CommentChannel::setCommentScript(const std::string& path, const std::string& comment) {
  return "tell application \"Finder\" to set comment of (POSIX file " + quote_applescript(path) +
         " as alias) to " + quote_applescript(comment) + "\n";
}

std::string CommentChannel::clearCommentScript(const std::string& path) {
  return "tell application \"Finder\" to set comment of (POSIX file " + quote_applescript(path) +
         " as alias) to missing value\n";
}

std::optional<RawValue> CommentChannel::read(const std::string&) {
  return std::nullopt;
}

void CommentChannel::write(const std::string&, const RawValue& value) {
  const json& j = json_of(value, "CommentChannel");
  if (!j.is_string()) throw TypeMismatch("Finder comment must be a string");
  const std::string comment = j.get<std::string>();
  if (comment.empty()) {
    remove(kFinderCommentKey);
    return;
  }
  scripts_->runScript(setCommentScript(path_, comment));
  spdlog::debug("finder comment set on {}", path_);
}

void CommentChannel::remove(const std::string&) {
  scripts_->runScript(clearCommentScript(path_));
  spdlog::debug("finder comment cleared on {}", path_);
}

// ---------- factory ----------

std::unique_ptr<BackendAdapter> makeAdapter(Backend backend, const Collaborators& c,
                                            const std::string& path) {
  switch (backend) {
    case Backend::ExtendedAttributeStore:
      return std::make_unique<ExtendedAttributeStore>(require(c.xattr, "xattr primitive"), path);
    case Backend::MetadataItemStore:
      return std::make_unique<MetadataItemStore>(require(c.items, "item store"), path);
    case Backend::ResourceKeyStore:
      return std::make_unique<ResourceKeyStore>(require(c.resources, "resource store"), path);
    case Backend::LegacyBinaryRecord:
      return std::make_unique<LegacyBinaryRecordStore>(require(c.xattr, "xattr primitive"), path);
    case Backend::CommentChannel:
      return std::make_unique<CommentChannel>(require(c.scripts, "script runner"), path);
  }
  throw std::invalid_argument("unknown backend");
}

} // namespace filemeta
