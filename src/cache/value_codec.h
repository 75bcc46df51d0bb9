#pragma once

/// @file value_codec.h
/// @brief Serialization of cache values into tagged byte envelopes
///
/// Every stored value starts with a one-byte format tag:
///
///   'r' <bytes>                  raw ASCII text, stored as given
///   's' <version> <CBOR payload> any other value, serialized
///
/// The tag is always written by EncodeValue and always checked by
/// DecodeValue, so plain text is never mistaken for a serialized payload.

#include <cstdint>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace rcache {

/// @brief Any value the cache can hold: null, scalars, binary, arrays, objects
using Value = nlohmann::json;

namespace cache {

/// @brief Leading byte of every stored value
enum class ValueFormat : char {
    kRaw = 'r',
    kEncoded = 's',
};

/// @brief Version byte written after the kEncoded tag
inline constexpr uint8_t kEncodingVersion = 2;

/// @brief True unless the value is a string made only of 7-bit ASCII bytes
bool NeedsEncoding(const Value& value);

/// @brief Produce the stored byte form of a value
absl::StatusOr<std::string> EncodeValue(const Value& value);

/// @brief Reconstruct a value from its stored byte form
///
/// Unknown tags, unsupported versions and corrupt payloads are reported as
/// DataLoss; the bytes are never handed back as a raw string instead.
absl::StatusOr<Value> DecodeValue(std::string_view blob);

}  // namespace cache
}  // namespace rcache
