#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>
#include <vector>

namespace suitegen {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha256(std::string_view text);

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha256_multi(Args&&... args) {
    Sha256Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

}  // namespace suitegen
