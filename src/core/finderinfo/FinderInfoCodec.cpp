#include "FinderInfoCodec.hpp"

#include <algorithm>
#include <string>

#include "core/errors/Errors.hpp"

namespace filemeta {

namespace {

constexpr std::size_t   kFlagsOffset    = 8;
constexpr std::uint16_t kColorMask      = 0x000E;
constexpr int           kColorShift     = 1;
constexpr std::uint16_t kStationeryMask = 0x0800;

void setFinderFlags(FinderInfoRecord& record, std::uint16_t flags) {
  record[kFlagsOffset]     = static_cast<std::uint8_t>(flags >> 8);
  record[kFlagsOffset + 1] = static_cast<std::uint8_t>(flags & 0xFF);
}

} // namespace

FinderInfoRecord toFinderInfoRecord(const Bytes& bytes) {
  if (bytes.size() != kFinderInfoSize) {
    throw BinaryDecodeError("FinderInfo must be " + std::to_string(kFinderInfoSize) +
                            " bytes, got " + std::to_string(bytes.size()));
  }
  FinderInfoRecord r{};
  std::copy(bytes.begin(), bytes.end(), r.begin());
  return r;
}

FinderInfoRecord recordOrTemplate(const std::optional<Bytes>& bytes) {
  if (!bytes) return FinderInfoRecord{};
  return toFinderInfoRecord(*bytes);
}

Bytes toBytes(const FinderInfoRecord& record) {
  return Bytes(record.begin(), record.end());
}

std::uint16_t finderFlags(const FinderInfoRecord& record) {
  return static_cast<std::uint16_t>((record[kFlagsOffset] << 8) | record[kFlagsOffset + 1]);
}

int decode_color(const FinderInfoRecord& record) {
  return (finderFlags(record) & kColorMask) >> kColorShift;
}

bool decode_stationery(const FinderInfoRecord& record) {
  return (finderFlags(record) & kStationeryMask) != 0;
}

FinderInfoRecord encode_color(const FinderInfoRecord& record, int color) {
  if (color < 0 || color > 7) {
    throw TypeMismatch("color must be in range 0 to 7: " + std::to_string(color));
  }
  FinderInfoRecord out = record;
  std::uint16_t flags = finderFlags(out);
  flags = static_cast<std::uint16_t>((flags & ~kColorMask) | (color << kColorShift));
  setFinderFlags(out, flags);
  return out;
}

FinderInfoRecord encode_stationery(const FinderInfoRecord& record, bool flag) {
  FinderInfoRecord out = record;
  std::uint16_t flags = finderFlags(out);
  flags = flag ? static_cast<std::uint16_t>(flags | kStationeryMask)
               : static_cast<std::uint16_t>(flags & ~kStationeryMask);
  setFinderFlags(out, flags);
  return out;
}

} // namespace filemeta
