#include "PayloadCodec.h"
#include <array>
#include <cstdint>

namespace Conduit::Utils {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int8_t, 256> BuildDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) {
        v = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

bool IsSpace(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

size_t CountCharacters(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        // Continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string Base64Encode(std::string_view bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < bytes.size()) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back(kAlphabet[n & 0x3F]);
        i += 3;
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 0x3F]);
        out.push_back(kAlphabet[(n >> 12) & 0x3F]);
        out.push_back(kAlphabet[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

Result<std::string> Base64Decode(std::string_view encoded) {
    std::string out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t buffer = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (char c : encoded) {
        if (IsSpace(c)) {
            continue;
        }
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return Result<std::string>::Err(ErrorCode::DecodeFailed,
                                            "Invalid base64 payload", "data after padding");
        }
        const int8_t v = kDecodeTable[static_cast<unsigned char>(c)];
        if (v < 0) {
            return Result<std::string>::Err(ErrorCode::DecodeFailed, "Invalid base64 payload",
                                            std::string("unexpected character '") + c + "'");
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    // A lone trailing symbol cannot carry a full byte
    if (symbols % 4 == 1 || padding > 2 || (padding > 0 && (symbols + padding) % 4 != 0)) {
        return Result<std::string>::Err(ErrorCode::DecodeFailed, "Invalid base64 payload",
                                        "truncated input");
    }
    return Result<std::string>::Ok(std::move(out));
}

PayloadRecord EncodeIfLarge(std::string text) {
    PayloadRecord record;
    if (CountCharacters(text) > kLargePayloadThreshold) {
        record.payload = Base64Encode(text);
        record.isEncoded = true;
    } else {
        record.payload = std::move(text);
    }
    return record;
}

Result<std::string> DecodePayload(const std::string& payload, bool isEncoded) {
    if (!isEncoded) {
        return Result<std::string>::Ok(payload);
    }
    return Base64Decode(payload);
}

} // namespace Conduit::Utils
