#include "LinuxXattr.hpp"

#include <sys/types.h>
#include <sys/xattr.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"

namespace filemeta {

static StorageError xattr_error(const char* op, const std::string& path,
                                const std::string& key, int err) {
  return StorageError(std::string(op) + " failed for " + path + " [" + key + "]: " +
                      std::strerror(err));
}

static bool is_absent(int err) {
#ifdef ENOATTR
  if (err == ENOATTR) return true;
#endif
  return err == ENODATA;
}

std::optional<Bytes> LinuxXattr::read(const std::string& path, const std::string& key) {
  const std::string name = prefix_ + key;
  // Size may change between the probe and the read; retry on ERANGE.
  for (int attempt = 0; attempt < 3; ++attempt) {
    ssize_t n = ::getxattr(path.c_str(), name.c_str(), nullptr, 0);
    if (n < 0) {
      if (is_absent(errno)) return std::nullopt;
      throw xattr_error("getxattr", path, name, errno);
    }
    Bytes buf(static_cast<size_t>(n));
    if (n == 0) return buf;
    ssize_t got = ::getxattr(path.c_str(), name.c_str(), buf.data(), buf.size());
    if (got >= 0) {
      buf.resize(static_cast<size_t>(got));
      return buf;
    }
    if (errno == ERANGE) continue;
    if (is_absent(errno)) return std::nullopt;
    throw xattr_error("getxattr", path, name, errno);
  }
  throw xattr_error("getxattr", path, name, ERANGE);
}

void LinuxXattr::write(const std::string& path, const std::string& key, const Bytes& value) {
  const std::string name = prefix_ + key;
  if (::setxattr(path.c_str(), name.c_str(), value.data(), value.size(), 0) != 0) {
    throw xattr_error("setxattr", path, name, errno);
  }
  spdlog::debug("xattr write {} [{}] {} bytes", path, name, value.size());
}

void LinuxXattr::remove(const std::string& path, const std::string& key) {
  const std::string name = prefix_ + key;
  if (::removexattr(path.c_str(), name.c_str()) != 0) {
    if (is_absent(errno)) return;
    throw xattr_error("removexattr", path, name, errno);
  }
  spdlog::debug("xattr remove {} [{}]", path, name);
}

std::vector<std::string> LinuxXattr::list(const std::string& path) {
  ssize_t n = ::listxattr(path.c_str(), nullptr, 0);
  if (n < 0) throw xattr_error("listxattr", path, "*", errno);
  std::string buf(static_cast<size_t>(n), '\0');
  if (n > 0) {
    n = ::listxattr(path.c_str(), &buf[0], buf.size());
    if (n < 0) throw xattr_error("listxattr", path, "*", errno);
    buf.resize(static_cast<size_t>(n));
  }

  std::vector<std::string> keys;
  size_t pos = 0;
  while (pos < buf.size()) {
    std::string name(buf.c_str() + pos);
    pos += name.size() + 1;
    if (name.compare(0, prefix_.size(), prefix_) == 0) {
      keys.push_back(name.substr(prefix_.size()));
    }
  }
  return keys;
}

} // namespace filemeta
