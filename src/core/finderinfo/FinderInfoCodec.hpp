#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "core/storage/Primitives.hpp"

namespace filemeta {

// com.apple.FinderInfo: 32 bytes, big-endian. The Finder flags word sits at
// bytes 8-9; the label color occupies flag bits 1-3 and the stationery pad
// flag is bit 11 (0x0800).
constexpr std::size_t kFinderInfoSize = 32;

using FinderInfoRecord = std::array<std::uint8_t, kFinderInfoSize>;

// Throws BinaryDecodeError unless bytes is exactly 32 long.
FinderInfoRecord toFinderInfoRecord(const Bytes& bytes);

// Existing record, or the all-zero template when none exists.
FinderInfoRecord recordOrTemplate(const std::optional<Bytes>& bytes);

Bytes toBytes(const FinderInfoRecord& record);

std::uint16_t finderFlags(const FinderInfoRecord& record);

int decode_color(const FinderInfoRecord& record);
bool decode_stationery(const FinderInfoRecord& record);

// Read-modify-write: only the target bits change. encode_color throws
// TypeMismatch for colors outside [0,7].
FinderInfoRecord encode_color(const FinderInfoRecord& record, int color);
FinderInfoRecord encode_stationery(const FinderInfoRecord& record, bool flag);

} // namespace filemeta
