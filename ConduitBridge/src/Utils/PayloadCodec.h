#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "Result.h"

namespace Conduit::Utils {

// Text payloads longer than this many characters travel base64-encoded.
inline constexpr size_t kLargePayloadThreshold = 10000;

struct PayloadRecord {
    std::string payload;
    bool isEncoded = false;
};

// Number of UTF-8 code points in text (invalid lead bytes count as one each)
size_t CountCharacters(std::string_view text);

std::string Base64Encode(std::string_view bytes);
Result<std::string> Base64Decode(std::string_view encoded);

// Returns the text unchanged unless it is over the threshold, in which case
// the payload carries the base64 form of its UTF-8 bytes.
PayloadRecord EncodeIfLarge(std::string text);

Result<std::string> DecodePayload(const std::string& payload, bool isEncoded);

} // namespace Conduit::Utils
