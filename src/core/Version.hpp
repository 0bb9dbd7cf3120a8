#pragma once

namespace filemeta {

inline constexpr const char* kVersion = "0.3.0";

} // namespace filemeta
