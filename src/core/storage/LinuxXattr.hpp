#pragma once
#include <string>

#include "core/storage/Primitives.hpp"

namespace filemeta {

// Extended attributes through <sys/xattr.h>. Linux only exposes arbitrary
// names under a namespace, so every key is stored as prefix + key.
class LinuxXattr : public XattrPrimitive {
public:
  explicit LinuxXattr(std::string prefix = "user.") : prefix_(std::move(prefix)) {}

  std::optional<Bytes> read(const std::string& path, const std::string& key) override;
  void write(const std::string& path, const std::string& key, const Bytes& value) override;
  void remove(const std::string& path, const std::string& key) override;
  std::vector<std::string> list(const std::string& path) override;

private:
  std::string prefix_;
};

} // namespace filemeta
