#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "core/registry/AttributeDescriptor.hpp"

namespace filemeta {

// Read-only table of every attribute filemeta knows about, addressable by
// canonical, short or long name.
class AttributeRegistry {
public:
  // Throws std::invalid_argument if any name appears twice in any slot.
  explicit AttributeRegistry(std::vector<AttributeDescriptor> descriptors);

  // Process-wide registry with the built-in attribute table.
  static const AttributeRegistry& instance();

  // Throws AttributeNotSupported.
  const AttributeDescriptor& resolve(const std::string& name) const;

  // nullptr when unknown.
  const AttributeDescriptor* find(const std::string& name) const;

  const std::vector<AttributeDescriptor>& all() const { return descriptors_; }

private:
  std::vector<AttributeDescriptor> descriptors_;
  std::unordered_map<std::string, size_t> byName_;
};

} // namespace filemeta
