#include "cache/value_codec.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace rcache::cache {

bool NeedsEncoding(const Value& value) {
    if (!value.is_string()) {
        return true;
    }
    for (unsigned char c : value.get_ref<const std::string&>()) {
        if (c >= 0x80) {
            return true;
        }
    }
    return false;
}

absl::StatusOr<std::string> EncodeValue(const Value& value) {
    std::string blob;

    if (!NeedsEncoding(value)) {
        const auto& text = value.get_ref<const std::string&>();
        blob.reserve(text.size() + 1);
        blob.push_back(static_cast<char>(ValueFormat::kRaw));
        blob.append(text);
        return blob;
    }

    blob.push_back(static_cast<char>(ValueFormat::kEncoded));
    blob.push_back(static_cast<char>(kEncodingVersion));
    try {
        Value::to_cbor(value, blob);
    } catch (const Value::exception& e) {
        return MakeError(ErrorCode::kSerializationError,
                         absl::StrCat("Failed to serialize value: ", e.what()));
    }
    return blob;
}

absl::StatusOr<Value> DecodeValue(std::string_view blob) {
    if (blob.empty()) {
        return MakeError(ErrorCode::kDeserializationError,
                         "Stored value has no format tag");
    }

    switch (static_cast<ValueFormat>(blob.front())) {
        case ValueFormat::kRaw:
            return Value(std::string(blob.substr(1)));

        case ValueFormat::kEncoded: {
            if (blob.size() < 2) {
                return MakeError(ErrorCode::kDeserializationError,
                                 "Serialized value is missing its version byte");
            }
            const auto version = static_cast<uint8_t>(blob[1]);
            if (version != kEncodingVersion) {
                return MakeError(ErrorCode::kDeserializationError,
                                 absl::StrCat("Unsupported encoding version ", version));
            }
            try {
                return Value::from_cbor(blob.data() + 2, blob.data() + blob.size(),
                                        /*strict=*/true, /*allow_exceptions=*/true,
                                        Value::cbor_tag_handler_t::store);
            } catch (const Value::exception& e) {
                return MakeError(ErrorCode::kDeserializationError,
                                 absl::StrCat("Corrupt serialized value: ", e.what()));
            }
        }
    }

    return MakeError(ErrorCode::kDeserializationError,
                     absl::StrCat("Unknown value format tag 0x",
                                  absl::Hex(static_cast<unsigned char>(blob.front()),
                                            absl::kZeroPad2)));
}

}  // namespace rcache::cache
