#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <compare>

namespace suitegen {

// ============================================================================
// Ledger Address Constants
// ============================================================================

// Ed25519 public key / account address
inline constexpr std::size_t PUBKEY_SIZE = 32;

// SHA-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Derived address limits (match the runtime's create_program_address)
inline constexpr std::size_t MAX_SEED_LENGTH = 32;
inline constexpr std::size_t MAX_SEEDS = 16;                 // including the nonce seed
inline constexpr std::uint8_t MAX_NONCE = 255;
inline constexpr std::string_view DERIVED_ADDRESS_MARKER = "ProgramDerivedAddress";

// ============================================================================
// Synthesis Constants
// ============================================================================

inline constexpr std::size_t OVERSIZED_STRING_LENGTH = 1000;     // used when no max length is declared
inline constexpr std::string_view STRING_SAMPLE = "test_value";
inline constexpr std::uint64_t UNSIGNED_SAMPLE = 1000;
inline constexpr std::int64_t SIGNED_SAMPLE = 500;

// ============================================================================
// Persistence Constants
// ============================================================================

inline constexpr std::size_t LEDGER_ACCOUNT_CEILING = 10 * 1024;      // max bytes per stored chunk
inline constexpr std::uint64_t LEDGER_COMPUTE_BUDGET = 200'000;       // compute units per transaction
inline constexpr std::uint32_t METADATA_MAGIC = 0x53474D31;           // "SGM1"

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using bytes_t = std::vector<std::uint8_t>;
using nonce_t = std::uint8_t;

// ============================================================================
// Public Key (32-byte account address, base58 text form)
// ============================================================================

struct Pubkey {
    std::array<std::uint8_t, PUBKEY_SIZE> bytes{};

    [[nodiscard]] std::string to_base58() const;
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Pubkey> from_base58(std::string_view text);
    [[nodiscard]] static std::optional<Pubkey> from_bytes(std::span<const std::uint8_t> data);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] auto begin() const { return bytes.begin(); }
    [[nodiscard]] auto end() const { return bytes.end(); }

    auto operator<=>(const Pubkey&) const = default;
};

// ============================================================================
// Byte Order
// ============================================================================

enum class ByteOrder : std::uint8_t {
    LITTLE = 0,
    BIG = 1,
};

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (i * 8));
    }
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (i * 8);
    }
    return val;
}

// Fixed-width integer encoding for seed material. Widths above 64 bits are
// sign- or zero-extended from the 64-bit value.
[[nodiscard]] bytes_t encode_unsigned(std::uint64_t value, std::size_t width_bits, ByteOrder order);
[[nodiscard]] bytes_t encode_signed(std::int64_t value, std::size_t width_bits, ByteOrder order);

// ============================================================================
// Hex / Base58 Encoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<bytes_t> hex_to_bytes(std::string_view hex);

[[nodiscard]] std::string encode_base58(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<bytes_t> decode_base58(std::string_view text);

}  // namespace suitegen
