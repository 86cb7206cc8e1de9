/**
 * @file binary_io.h
 * @brief Little-endian binary primitives used by snapshot and model serialization
 *
 * All helpers return false once the stream enters a failed state, so callers can
 * chain them and check once per logical field.
 */

#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace finrag::utils {

// Upper bound for any length prefix read back from disk
constexpr uint32_t kMaxSerializedLength = 256U * 1024U * 1024U;

template <typename T>
bool WriteBinary(std::ostream& output_stream, const T& value) {
  static_assert(std::is_trivially_copyable_v<T>, "WriteBinary requires a trivially copyable type");
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  output_stream.write(reinterpret_cast<const char*>(&value), sizeof(T));
  return output_stream.good();
}

template <typename T>
bool ReadBinary(std::istream& input_stream, T& value) {
  static_assert(std::is_trivially_copyable_v<T>, "ReadBinary requires a trivially copyable type");
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(&value), sizeof(T));
  return input_stream.good();
}

/**
 * @brief Write string to stream (uint32 length prefix)
 */
inline bool WriteString(std::ostream& output_stream, const std::string& str) {
  auto len = static_cast<uint32_t>(str.size());
  if (!WriteBinary(output_stream, len)) {
    return false;
  }
  if (len > 0) {
    output_stream.write(str.data(), len);
  }
  return output_stream.good();
}

/**
 * @brief Read string from stream (uint32 length prefix)
 */
inline bool ReadString(std::istream& input_stream, std::string& str) {
  uint32_t len = 0;
  if (!ReadBinary(input_stream, len) || len > kMaxSerializedLength) {
    return false;
  }
  str.resize(len);
  if (len > 0) {
    input_stream.read(str.data(), len);
  }
  return input_stream.good();
}

/**
 * @brief Write a float vector (uint32 count prefix)
 */
inline bool WriteFloats(std::ostream& output_stream, const std::vector<float>& values) {
  auto count = static_cast<uint32_t>(values.size());
  if (!WriteBinary(output_stream, count)) {
    return false;
  }
  if (count > 0) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    output_stream.write(reinterpret_cast<const char*>(values.data()),
                        static_cast<std::streamsize>(count * sizeof(float)));
  }
  return output_stream.good();
}

inline bool ReadFloats(std::istream& input_stream, std::vector<float>& values) {
  uint32_t count = 0;
  if (!ReadBinary(input_stream, count) || count > kMaxSerializedLength / sizeof(float)) {
    return false;
  }
  values.resize(count);
  if (count > 0) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    input_stream.read(reinterpret_cast<char*>(values.data()), static_cast<std::streamsize>(count * sizeof(float)));
  }
  return input_stream.good();
}

}  // namespace finrag::utils
