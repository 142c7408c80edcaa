/**
 * @file ByteOrder.h
 * @brief Endianness helpers shared by the streamline readers and writers
 */

#ifndef BYTE_ORDER_H
#define BYTE_ORDER_H

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <vector>

namespace tractoscore {
namespace io {
namespace byteorder {

inline bool IsLittleEndianHost() {
  const uint16_t probe = 1;
  uint8_t first = 0;
  std::memcpy(&first, &probe, 1);
  return first == 1;
}

template <typename T> void SwapEndianness(T &value) {
  char *bytes = reinterpret_cast<char *>(&value);
  std::reverse(bytes, bytes + sizeof(T));
}

/// Reads a T stored with the given byte order at data
template <typename T> T Load(const uint8_t *data, bool little_endian) {
  T value;
  std::memcpy(&value, data, sizeof(T));
  if (little_endian != IsLittleEndianHost())
    SwapEndianness(value);
  return value;
}

/// Appends a T with the given byte order
template <typename T>
void Append(std::vector<uint8_t> &bytes, T value, bool little_endian) {
  if (little_endian != IsLittleEndianHost())
    SwapEndianness(value);
  const uint8_t *raw = reinterpret_cast<const uint8_t *>(&value);
  bytes.insert(bytes.end(), raw, raw + sizeof(T));
}

} // namespace byteorder
} // namespace io
} // namespace tractoscore

#endif // BYTE_ORDER_H
