#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <vector>

#include "core/errors/Errors.hpp"
#include "core/registry/AttributeRegistry.hpp"

using namespace filemeta;

TEST(AttributeRegistry, ResolvesAllThreeNames) {
  const auto& reg = AttributeRegistry::instance();
  const auto& byCanonical = reg.resolve("keywords");
  EXPECT_EQ(&reg.resolve("kMDItemKeywords"), &byCanonical);
  EXPECT_EQ(&reg.resolve("com.apple.metadata:kMDItemKeywords"), &byCanonical);
  EXPECT_EQ(byCanonical.kind, ValueKind::StringList);
}

TEST(AttributeRegistry, UnknownNameIsNotSupported) {
  const auto& reg = AttributeRegistry::instance();
  EXPECT_EQ(reg.find("flavor"), nullptr);
  try {
    reg.resolve("flavor");
    FAIL() << "expected AttributeNotSupported";
  } catch (const AttributeNotSupported& e) {
    EXPECT_EQ(e.name(), "flavor");
  }
}

TEST(AttributeRegistry, EveryNameIsUnique) {
  std::set<std::string> seen;
  for (const auto& d : AttributeRegistry::instance().all()) {
    std::set<std::string> own{d.canonicalName, d.shortName, d.longName};
    for (const auto& n : own) EXPECT_TRUE(seen.insert(n).second) << n;
  }
}

TEST(AttributeRegistry, RejectsDuplicateNames) {
  AttributeDescriptor a{"one", "kOne", "long.one", ValueKind::String, {}, ""};
  AttributeDescriptor b{"two", "kOne", "long.two", ValueKind::String, {}, ""};
  std::vector<AttributeDescriptor> both{a, b};
  EXPECT_THROW(AttributeRegistry{both}, std::invalid_argument);
}

TEST(AttributeRegistry, TagBindingsCoverAllThreeRepresentations) {
  const auto& tags = AttributeRegistry::instance().resolve("_kMDItemUserTags");
  ASSERT_EQ(tags.bindings.size(), 3u);
  EXPECT_EQ(tags.bindings[0].backend, Backend::ExtendedAttributeStore);
  EXPECT_EQ(tags.bindings[0].physicalKey, kUserTagsKey);
  EXPECT_EQ(tags.bindings[1].backend, Backend::ResourceKeyStore);
  EXPECT_EQ(tags.bindings[2].backend, Backend::LegacyBinaryRecord);
  EXPECT_EQ(tags.bindings[2].legacyField, LegacyField::Color);
}

TEST(AttributeRegistry, FinderCommentReadsFromItemStoreAndWritesViaFinder) {
  const auto& d = AttributeRegistry::instance().resolve("findercomment");
  ASSERT_FALSE(d.bindings.empty());
  EXPECT_EQ(d.bindings.front().backend, Backend::MetadataItemStore);
  EXPECT_FALSE(d.bindings.front().writeCapable);
  EXPECT_EQ(d.bindings.back().backend, Backend::CommentChannel);
  EXPECT_FALSE(d.bindings.back().readCapable);
  EXPECT_TRUE(d.isWritable());
}

TEST(AttributeRegistry, ItemOnlyAttributesAreReadOnly) {
  const auto& reg = AttributeRegistry::instance();
  EXPECT_FALSE(reg.resolve("contenttype").isWritable());
  EXPECT_TRUE(reg.resolve("contenttype").isReadable());
  EXPECT_TRUE(reg.resolve("starrating").isWritable());
}

TEST(BackendBinding, LabelNamesBackendKeyAndField) {
  BackendBinding b{Backend::LegacyBinaryRecord, kFinderInfoKey, LegacyField::Stationery, true, true};
  EXPECT_EQ(b.label(), "LegacyBinaryRecord:com.apple.FinderInfo#stationery");
}
