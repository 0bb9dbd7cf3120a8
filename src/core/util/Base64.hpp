#pragma once
#include <optional>
#include <string>

#include "core/storage/Primitives.hpp"

namespace filemeta {

// Standard alphabet with '=' padding. Used for raw extended attributes in
// backups.
std::string encodeBase64(const Bytes& data);

// std::nullopt on characters outside the alphabet or a bad length.
// Whitespace is ignored; an empty string decodes to no bytes.
std::optional<Bytes> decodeBase64(const std::string& text);

} // namespace filemeta
