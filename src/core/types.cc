#include "types.hh"
#include <algorithm>

namespace suitegen {

namespace {

constexpr char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_digit(char c) {
    const char* pos = std::find(BASE58_ALPHABET, BASE58_ALPHABET + 58, c);
    if (pos == BASE58_ALPHABET + 58) {
        return -1;
    }
    return static_cast<int>(pos - BASE58_ALPHABET);
}

bytes_t encode_fixed(std::uint64_t value, std::uint8_t fill, std::size_t width_bits, ByteOrder order) {
    std::size_t width = width_bits / 8;
    bytes_t out(width, fill);
    for (std::size_t i = 0; i < width && i < 8; ++i) {
        out[i] = static_cast<std::uint8_t>(value >> (i * 8));
    }
    if (order == ByteOrder::BIG) {
        std::reverse(out.begin(), out.end());
    }
    return out;
}

}  // namespace

// ============================================================================
// Fixed-width Integer Encoding
// ============================================================================

bytes_t encode_unsigned(std::uint64_t value, std::size_t width_bits, ByteOrder order) {
    return encode_fixed(value, 0x00, width_bits, order);
}

bytes_t encode_signed(std::int64_t value, std::size_t width_bits, ByteOrder order) {
    std::uint8_t fill = value < 0 ? 0xFF : 0x00;
    return encode_fixed(static_cast<std::uint64_t>(value), fill, width_bits, order);
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::optional<bytes_t> hex_to_bytes(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    bytes_t result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = nibble(hex[i]);
        int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

// ============================================================================
// Base58 Encoding/Decoding
// ============================================================================

std::string encode_base58(std::span<const std::uint8_t> bytes) {
    std::size_t zeroes = 0;
    while (zeroes < bytes.size() && bytes[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    std::vector<std::uint8_t> b58((bytes.size() - zeroes) * 138 / 100 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = zeroes; i < bytes.size(); ++i) {
        int carry = bytes[i];
        std::size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<std::uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string result(zeroes, '1');
    result.reserve(zeroes + static_cast<std::size_t>(b58.end() - it));
    for (; it != b58.end(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

std::optional<bytes_t> decode_base58(std::string_view text) {
    std::size_t zeroes = 0;
    while (zeroes < text.size() && text[zeroes] == '1') {
        ++zeroes;
    }

    // log(58) / log(256), rounded up
    std::vector<std::uint8_t> b256((text.size() - zeroes) * 733 / 1000 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = zeroes; i < text.size(); ++i) {
        int carry = base58_digit(text[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        std::size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<std::uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    bytes_t result(zeroes, 0x00);
    result.insert(result.end(), it, b256.end());
    return result;
}

// ============================================================================
// Pubkey Implementation
// ============================================================================

std::string Pubkey::to_base58() const {
    return encode_base58(bytes);
}

std::string Pubkey::to_hex() const {
    return bytes_to_hex(bytes);
}

std::optional<Pubkey> Pubkey::from_base58(std::string_view text) {
    auto decoded = decode_base58(text);
    if (!decoded) {
        return std::nullopt;
    }
    return from_bytes(*decoded);
}

std::optional<Pubkey> Pubkey::from_bytes(std::span<const std::uint8_t> data) {
    if (data.size() != PUBKEY_SIZE) {
        return std::nullopt;
    }
    Pubkey key;
    std::copy(data.begin(), data.end(), key.bytes.begin());
    return key;
}

}  // namespace suitegen
