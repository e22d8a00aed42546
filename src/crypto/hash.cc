#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <stdexcept>

namespace suitegen {

// ============================================================================
// Sha256Hasher Implementation
// ============================================================================

Sha256Hasher::Sha256Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA-256");
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void Sha256Hasher::update(std::string_view text) {
    update(text.data(), text.size());
}

void Sha256Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        log::crypto.error("SHA-256 update failed");
        throw std::runtime_error("SHA-256 update failed");
    }
}

hash_t Sha256Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), result.data(), &len) != 1) {
        log::crypto.error("SHA-256 finalize failed");
        throw std::runtime_error("SHA-256 finalize failed");
    }
    return result;
}

void Sha256Hasher::reset() {
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        log::crypto.error("SHA-256 reset failed");
        throw std::runtime_error("SHA-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha256(std::span<const std::uint8_t> data) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data.data(), data.size(), result.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        log::crypto.error("SHA-256 failed");
        throw std::runtime_error("SHA-256 failed");
    }
    return result;
}

hash_t sha256(std::string_view text) {
    return sha256(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

}  // namespace suitegen
