#include "TagSync.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"

namespace filemeta {

namespace {

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> names_of(const std::vector<Tag>& tags) {
  std::vector<std::string> out;
  out.reserve(tags.size());
  for (const auto& t : tags) out.push_back(t.name);
  return out;
}

} // namespace

TagSync::TagSync(const AttributeDescriptor& descriptor) : descriptor_(descriptor) {
  if (!descriptor.isTagLike()) {
    throw std::invalid_argument(descriptor.canonicalName + " is not a tag attribute");
  }
  for (const auto& b : descriptor.bindings) {
    switch (b.backend) {
      case Backend::ExtendedAttributeStore: userTags_ = &b; break;
      case Backend::ResourceKeyStore:       tagNames_ = &b; break;
      case Backend::LegacyBinaryRecord:
        if (b.legacyField == LegacyField::Color) finderInfo_ = &b;
        break;
      default: break;
    }
  }
}

std::vector<Tag> TagSync::normalize(const std::vector<Tag>& tags) {
  std::vector<Tag> out;
  std::unordered_set<std::string> seen;
  for (const auto& in : tags) {
    Tag t{trim(in.name), in.color};
    if (t.name.empty()) throw TypeMismatch("tag name must not be empty");
    if (t.color < kColorNone || t.color > kMaxColor) {
      throw TypeMismatch("tag color must be in range 0 to 7: " + t.name + "," +
                         std::to_string(t.color));
    }
    if (!seen.insert(t.name).second) {
      spdlog::debug("dropping duplicate tag '{}'", t.name);
      continue;
    }
    if (t.color == kColorNone) {
      if (auto c = reservedColorForName(t.name)) t.color = *c;
    }
    out.push_back(std::move(t));
  }
  return out;
}

// Finder's own choice among several colored tags is undocumented; the first
// colored tag is an approximation.
int TagSync::projectColor(const std::vector<Tag>& tags) {
  for (const auto& t : tags) {
    if (t.color != kColorNone) return t.color;
  }
  return kColorNone;
}

std::vector<Tag> TagSync::reconcile(const std::optional<RawValue>& userTags,
                                    const std::optional<RawValue>& tagNames,
                                    const std::optional<RawValue>& finderInfo,
                                    const CoercionOptions& options) const {
  if (userTags_ && userTags) {
    auto tags = decode(*userTags_, ValueKind::TagList, userTags, options).asTags();
    if (tagNames_ && tagNames) {
      auto names = decode(*tagNames_, ValueKind::TagList, tagNames, options).asTags();
      if (names_of(names) != names_of(tags)) {
        spdlog::debug("{}: resource tag names disagree with user tags ({} vs {})",
                      descriptor_.canonicalName, names.size(), tags.size());
      }
    }
    return tags;
  }

  if (finderInfo_ && finderInfo) {
    int color = decode(*finderInfo_, ValueKind::Integer, finderInfo, options).asInteger();
    if (color != kColorNone) {
      // label applied outside of tags, e.g. by the Finder's color menu
      return {Tag{labelNameForColor(color), color}};
    }
  }
  return {};
}

std::optional<BindingWrite> TagSync::planColor(int color,
                                               const std::optional<RawValue>& finderInfo,
                                               const CoercionOptions& options) const {
  if (!finderInfo_ || !finderInfo_->writeCapable) return std::nullopt;
  if (!finderInfo) {
    if (color == kColorNone) return std::nullopt;  // template is already color 0
  } else {
    auto current = decode(*finderInfo_, ValueKind::Integer, finderInfo, options).asInteger();
    if (current == color) return std::nullopt;
  }
  RawValue rec = encode(*finderInfo_, ValueKind::Integer, Value::ofInteger(color), options,
                        finderInfo);
  return BindingWrite{finderInfo_, std::move(rec)};
}

std::vector<BindingWrite> TagSync::planSet(const std::vector<Tag>& tags,
                                           const std::optional<RawValue>& finderInfo,
                                           const CoercionOptions& options) const {
  const Value value = Value::ofTags(tags);
  std::vector<BindingWrite> plan;
  for (const auto& b : descriptor_.bindings) {
    if (!b.writeCapable) continue;
    if (&b == userTags_ || &b == tagNames_) {
      plan.push_back({&b, encode(b, ValueKind::TagList, value, options, std::nullopt)});
    } else if (&b == finderInfo_) {
      if (auto w = planColor(projectColor(tags), finderInfo, options)) plan.push_back(*w);
    }
  }
  return plan;
}

std::vector<BindingWrite> TagSync::planClear(const std::optional<RawValue>& finderInfo,
                                             const CoercionOptions& options) const {
  std::vector<BindingWrite> plan;
  for (const auto& b : descriptor_.bindings) {
    if (!b.writeCapable) continue;
    if (&b == userTags_ || &b == tagNames_) {
      plan.push_back({&b, std::nullopt});
    } else if (&b == finderInfo_) {
      if (auto w = planColor(kColorNone, finderInfo, options)) plan.push_back(*w);
    }
  }
  return plan;
}

} // namespace filemeta
