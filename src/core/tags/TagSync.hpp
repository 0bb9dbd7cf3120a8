#pragma once
#include <optional>
#include <vector>

#include "core/registry/AttributeDescriptor.hpp"
#include "core/storage/Primitives.hpp"
#include "core/value/Coercion.hpp"
#include "core/value/Value.hpp"

namespace filemeta {

// One pending write against one binding; std::nullopt value means remove.
struct BindingWrite {
  const BackendBinding* binding;
  std::optional<RawValue> value;
};

// Keeps the three representations of Finder tags in agreement:
//   (a) name/color pairs in the _kMDItemUserTags extended attribute,
//   (b) bare names under NSURLTagNamesKey in the resource store,
//   (c) one label color in the FinderInfo record.
// TagSync only plans; MetadataObject performs the reads and writes.
class TagSync {
public:
  // Throws std::invalid_argument unless descriptor is a TagList attribute.
  explicit TagSync(const AttributeDescriptor& descriptor);

  // Trims names, drops later duplicates by name and gives uncolored reserved
  // names (Red, Blue, ...) their label color. Throws TypeMismatch on empty
  // names or colors outside [0,7].
  static std::vector<Tag> normalize(const std::vector<Tag>& tags);

  // Color of the first tag with a non-zero color, else 0.
  static int projectColor(const std::vector<Tag>& tags);

  const BackendBinding* userTagsBinding() const { return userTags_; }
  const BackendBinding* tagNamesBinding() const { return tagNames_; }
  const BackendBinding* finderInfoBinding() const { return finderInfo_; }

  // Canonical tag list from what the stores hold. Prefers (a); falls back to
  // a single tag named after (c)'s color. (b) is only checked against (a).
  std::vector<Tag> reconcile(const std::optional<RawValue>& userTags,
                             const std::optional<RawValue>& tagNames,
                             const std::optional<RawValue>& finderInfo,
                             const CoercionOptions& options) const;

  // Writes for set(tags); `tags` must already be normalized. `finderInfo` is
  // the current record, if any.
  std::vector<BindingWrite> planSet(const std::vector<Tag>& tags,
                                    const std::optional<RawValue>& finderInfo,
                                    const CoercionOptions& options) const;

  // Writes for clear(): removes (a) and (b), zeroes the color bits of (c).
  std::vector<BindingWrite> planClear(const std::optional<RawValue>& finderInfo,
                                      const CoercionOptions& options) const;

private:
  std::optional<BindingWrite> planColor(int color,
                                        const std::optional<RawValue>& finderInfo,
                                        const CoercionOptions& options) const;

  const AttributeDescriptor& descriptor_;
  const BackendBinding* userTags_ = nullptr;
  const BackendBinding* tagNames_ = nullptr;
  const BackendBinding* finderInfo_ = nullptr;
};

} // namespace filemeta
