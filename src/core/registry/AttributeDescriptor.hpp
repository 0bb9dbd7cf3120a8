#pragma once
#include <string>
#include <vector>

#include "core/value/Value.hpp"

namespace filemeta {

enum class Backend {
  MetadataItemStore,
  ResourceKeyStore,
  ExtendedAttributeStore,
  LegacyBinaryRecord,
  CommentChannel
};

const char* to_string(Backend backend);

// Sub-field of the 32-byte FinderInfo record a binding projects.
enum class LegacyField { None, Color, Stationery };

// Physical keys shared by several descriptors.
inline constexpr const char* kFinderInfoKey       = "com.apple.FinderInfo";
inline constexpr const char* kUserTagsKey         = "com.apple.metadata:_kMDItemUserTags";
inline constexpr const char* kTagNamesResourceKey = "NSURLTagNamesKey";
inline constexpr const char* kLabelNumberKey      = "NSURLLabelNumberKey";
inline constexpr const char* kFinderCommentKey    = "kMDItemFinderComment";

struct BackendBinding {
  Backend     backend;
  std::string physicalKey;
  LegacyField legacyField = LegacyField::None;
  bool        readCapable = true;
  bool        writeCapable = true;

  // "ExtendedAttributeStore:com.apple.metadata:kMDItemKeywords"
  std::string label() const;
};

struct AttributeDescriptor {
  std::string canonicalName;
  std::string shortName;
  std::string longName;
  ValueKind   kind;
  std::vector<BackendBinding> bindings;
  std::string help;

  bool isList() const { return isListKind(kind); }
  bool isTagLike() const { return kind == ValueKind::TagList; }
  bool isWritable() const;
  bool isReadable() const;
};

} // namespace filemeta
