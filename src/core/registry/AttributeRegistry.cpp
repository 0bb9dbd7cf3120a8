#include "AttributeRegistry.hpp"

#include <stdexcept>

#include "core/errors/Errors.hpp"

namespace filemeta {

// ---------- descriptor helpers ----------

const char* to_string(Backend backend) {
  switch (backend) {
    case Backend::MetadataItemStore:      return "MetadataItemStore";
    case Backend::ResourceKeyStore:       return "ResourceKeyStore";
    case Backend::ExtendedAttributeStore: return "ExtendedAttributeStore";
    case Backend::LegacyBinaryRecord:     return "LegacyBinaryRecord";
    case Backend::CommentChannel:         return "CommentChannel";
  }
  return "unknown";
}

std::string BackendBinding::label() const {
  std::string s = std::string(to_string(backend)) + ":" + physicalKey;
  if (legacyField == LegacyField::Color) s += "#color";
  if (legacyField == LegacyField::Stationery) s += "#stationery";
  return s;
}

bool AttributeDescriptor::isWritable() const {
  for (const auto& b : bindings) if (b.writeCapable) return true;
  return false;
}

bool AttributeDescriptor::isReadable() const {
  for (const auto& b : bindings) if (b.readCapable) return true;
  return false;
}

// ---------- built-in table ----------

namespace {

const std::string kMetadataPrefix = "com.apple.metadata:";

BackendBinding xattr_rw(const std::string& key) {
  return {Backend::ExtendedAttributeStore, key, LegacyField::None, true, true};
}

// Attribute stored only as a com.apple.metadata:<short> extended attribute.
AttributeDescriptor xattr_attr(const std::string& name, const std::string& shortName,
                               ValueKind kind, const std::string& help) {
  const std::string key = kMetadataPrefix + shortName;
  return {name, shortName, key, kind, {xattr_rw(key)}, help};
}

// Read-only attribute served by the metadata-item store.
AttributeDescriptor item_attr(const std::string& name, const std::string& shortName,
                              ValueKind kind, const std::string& help) {
  return {name, shortName, kMetadataPrefix + shortName, kind,
          {{Backend::MetadataItemStore, shortName, LegacyField::None, true, false}}, help};
}

std::vector<AttributeDescriptor> builtin_descriptors() {
  std::vector<AttributeDescriptor> d;

  d.push_back(xattr_attr("authors", "kMDItemAuthors", ValueKind::StringList,
                         "The author, or authors, of the contents of the file."));
  d.push_back(xattr_attr("comment", "kMDItemComment", ValueKind::String,
                         "A comment related to the file. Differs from the Finder comment."));
  d.push_back(xattr_attr("copyright", "kMDItemCopyright", ValueKind::String,
                         "The copyright owner of the file contents."));
  d.push_back(xattr_attr("creator", "kMDItemCreator", ValueKind::String,
                         "Application used to create the document content."));
  d.push_back(xattr_attr("description", "kMDItemDescription", ValueKind::String,
                         "A description of the content of the resource."));
  d.push_back(xattr_attr("downloadeddate", "kMDItemDownloadedDate", ValueKind::DateTimeList,
                         "The date(s) the item was downloaded."));
  d.push_back(xattr_attr("duedate", "kMDItemDueDate", ValueKind::DateTime,
                         "The date the item is due."));
  d.push_back(xattr_attr("headline", "kMDItemHeadline", ValueKind::String,
                         "A publishable synopsis of the contents of the file."));
  d.push_back(xattr_attr("keywords", "kMDItemKeywords", ValueKind::StringList,
                         "Keywords associated with this file. Differs from Finder tags."));
  d.push_back(xattr_attr("participants", "kMDItemParticipants", ValueKind::StringList,
                         "The people or organizations that participated in the file's content."));
  d.push_back(xattr_attr("projects", "kMDItemProjects", ValueKind::StringList,
                         "The names of projects the file is part of."));
  d.push_back(xattr_attr("starrating", "kMDItemStarRating", ValueKind::Integer,
                         "User rating of the file, 0 to 5."));
  d.push_back(xattr_attr("wherefroms", "kMDItemWhereFroms", ValueKind::StringList,
                         "Where the file was obtained from, e.g. the download URL."));

  // Readable from the item store, writable only through the Finder.
  d.push_back({"findercomment", kFinderCommentKey, kMetadataPrefix + kFinderCommentKey,
               ValueKind::String,
               {{Backend::MetadataItemStore, kFinderCommentKey, LegacyField::None, true, false},
                xattr_rw(kMetadataPrefix + kFinderCommentKey),
                {Backend::CommentChannel, kFinderCommentKey, LegacyField::None, false, true}},
               "Finder comments for this file."});

  d.push_back({"tags", "_kMDItemUserTags", kUserTagsKey, ValueKind::TagList,
               {xattr_rw(kUserTagsKey),
                {Backend::ResourceKeyStore, kTagNamesResourceKey, LegacyField::None, true, true},
                {Backend::LegacyBinaryRecord, kFinderInfoKey, LegacyField::Color, true, true}},
               "Finder tags; a list of (name, color) pairs. Keeps the label color in sync."});

  d.push_back({"findercolor", "FinderColor", std::string(kFinderInfoKey) + ":findercolor",
               ValueKind::Integer,
               {{Backend::LegacyBinaryRecord, kFinderInfoKey, LegacyField::Color, true, true},
                {Backend::ResourceKeyStore, kLabelNumberKey, LegacyField::None, true, true}},
               "Finder label color, 0 (none) to 7."});

  d.push_back({"stationerypad", "StationeryPad", std::string(kFinderInfoKey) + ":stationerypad",
               ValueKind::Boolean,
               {{Backend::LegacyBinaryRecord, kFinderInfoKey, LegacyField::Stationery, true, true}},
               "Stationery pad flag of the Finder info record."});

  d.push_back({"hidden", "NSURLIsHiddenKey", "NSURLIsHiddenKey", ValueKind::Boolean,
               {{Backend::ResourceKeyStore, "NSURLIsHiddenKey", LegacyField::None, true, true}},
               "Whether the file is hidden from the user."});

  d.push_back(item_attr("contentcreationdate", "kMDItemContentCreationDate", ValueKind::DateTime,
                        "The date and time the content was created."));
  d.push_back(item_attr("contenttype", "kMDItemContentType", ValueKind::String,
                        "The uniform type identifier of the file."));
  d.push_back(item_attr("displayname", "kMDItemDisplayName", ValueKind::String,
                        "The localized name of the file."));
  return d;
}

} // namespace

// ---------- registry ----------

AttributeRegistry::AttributeRegistry(std::vector<AttributeDescriptor> descriptors)
  : descriptors_(std::move(descriptors)) {
  for (size_t i = 0; i < descriptors_.size(); ++i) {
    const auto& d = descriptors_[i];
    for (const std::string* n : {&d.canonicalName, &d.shortName, &d.longName}) {
      auto it = byName_.find(*n);
      // short and long name may coincide within one descriptor (e.g. hidden)
      if (it != byName_.end() && it->second != i) {
        throw std::invalid_argument("duplicate attribute name in registry: " + *n);
      }
      byName_[*n] = i;
    }
  }
}

const AttributeRegistry& AttributeRegistry::instance() {
  static const AttributeRegistry registry(builtin_descriptors());
  return registry;
}

const AttributeDescriptor* AttributeRegistry::find(const std::string& name) const {
  auto it = byName_.find(name);
  return it == byName_.end() ? nullptr : &descriptors_[it->second];
}

const AttributeDescriptor& AttributeRegistry::resolve(const std::string& name) const {
  if (auto* d = find(name)) return *d;
  throw AttributeNotSupported(name);
}

} // namespace filemeta
