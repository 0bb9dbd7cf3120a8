#pragma once
#include <memory>
#include <optional>
#include <string>

#include "core/registry/AttributeDescriptor.hpp"
#include "core/storage/Primitives.hpp"

namespace filemeta {

// The platform services one MetadataObject talks to.
struct Collaborators {
  std::shared_ptr<XattrPrimitive>     xattr;
  std::shared_ptr<ItemValueSource>    items;
  std::shared_ptr<ResourceValueStore> resources;
  std::shared_ptr<ScriptRunner>       scripts;
};

// Read/write contract of one backend, bound to one file.
class BackendAdapter {
public:
  virtual ~BackendAdapter() = default;
  virtual Backend kind() const = 0;
  // std::nullopt when nothing is stored under key.
  virtual std::optional<RawValue> read(const std::string& key) = 0;
  virtual void write(const std::string& key, const RawValue& value) = 0;
  // Removing an absent key is not an error.
  virtual void remove(const std::string& key) = 0;
};

class ExtendedAttributeStore : public BackendAdapter {
public:
  ExtendedAttributeStore(std::shared_ptr<XattrPrimitive> xattr, std::string path)
    : xattr_(std::move(xattr)), path_(std::move(path)) {}

  Backend kind() const override { return Backend::ExtendedAttributeStore; }
  std::optional<RawValue> read(const std::string& key) override;
  void write(const std::string& key, const RawValue& value) override;
  void remove(const std::string& key) override;

private:
  std::shared_ptr<XattrPrimitive> xattr_;
  std::string path_;
};

// Read-only; write and remove throw ReadOnlyAttribute.
class MetadataItemStore : public BackendAdapter {
public:
  MetadataItemStore(std::shared_ptr<ItemValueSource> items, std::string path)
    : items_(std::move(items)), path_(std::move(path)) {}

  Backend kind() const override { return Backend::MetadataItemStore; }
  std::optional<RawValue> read(const std::string& key) override;
  void write(const std::string& key, const RawValue& value) override;
  void remove(const std::string& key) override;

private:
  std::shared_ptr<ItemValueSource> items_;
  std::string path_;
};

class ResourceKeyStore : public BackendAdapter {
public:
  ResourceKeyStore(std::shared_ptr<ResourceValueStore> resources, std::string path)
    : resources_(std::move(resources)), path_(std::move(path)) {}

  // NSURLTagNamesKey, NSURLLabelNumberKey and NSURLIsHiddenKey.
  static bool isWritableKey(const std::string& key);

  Backend kind() const override { return Backend::ResourceKeyStore; }
  std::optional<RawValue> read(const std::string& key) override;
  void write(const std::string& key, const RawValue& value) override;
  void remove(const std::string& key) override;

private:
  std::shared_ptr<ResourceValueStore> resources_;
  std::string path_;
};

// The 32-byte com.apple.FinderInfo record, whole. Sub-field access goes
// through FinderInfoCodec.
class LegacyBinaryRecordStore : public BackendAdapter {
public:
  LegacyBinaryRecordStore(std::shared_ptr<XattrPrimitive> xattr, std::string path)
    : xattr_(std::move(xattr)), path_(std::move(path)) {}

  Backend kind() const override { return Backend::LegacyBinaryRecord; }
  // Throws BinaryDecodeError when the stored record is not 32 bytes.
  std::optional<RawValue> read(const std::string& key) override;
  void write(const std::string& key, const RawValue& value) override;
  void remove(const std::string& key) override;

private:
  std::shared_ptr<XattrPrimitive> xattr_;
  std::string path_;
};

// Sets the Finder comment by asking the Finder to do it. Write-only: the
// comment is read back through the metadata-item store.
class CommentChannel : public BackendAdapter {
public:
  CommentChannel(std::shared_ptr<ScriptRunner> scripts, std::string path)
    : scripts_(std::move(scripts)), path_(std::move(path)) {}

  static std::string setCommentScript(const std::string& path, const std::string& comment);
  static std::string clearCommentScript(const std::string& path);

  Backend kind() const override { return Backend::CommentChannel; }
  std::optional<RawValue> read(const std::string& key) override;
  void write(const std::string& key, const RawValue& value) override;
  void remove(const std::string& key) override;

private:
  std::shared_ptr<ScriptRunner> scripts_;
  std::string path_;
};

std::unique_ptr<BackendAdapter> makeAdapter(Backend backend, const Collaborators& c,
                                            const std::string& path);

} // namespace filemeta
