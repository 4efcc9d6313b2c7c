#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace mosaic {

namespace {

const char* openssl_digest_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA3_256: return "SHA3-256";
        case HashAlgorithm::KECCAK_256: return "KECCAK-256";
    }
    return "SHA3-256";
}

EVP_MD* fetch_digest(HashAlgorithm algorithm) {
    return EVP_MD_fetch(nullptr, openssl_digest_name(algorithm), nullptr);
}

}  // namespace

// ============================================================================
// Algorithm Queries
// ============================================================================

std::string_view hash_algorithm_name(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA3_256: return "sha3-256";
        case HashAlgorithm::KECCAK_256: return "keccak-256";
    }
    return "unknown";
}

bool hash_algorithm_available(HashAlgorithm algorithm) {
    EVP_MD* md = fetch_digest(algorithm);
    if (!md) {
        return false;
    }
    EVP_MD_free(md);
    return true;
}

// ============================================================================
// Hasher Implementation
// ============================================================================

Hasher::Hasher(HashAlgorithm algorithm)
    : algorithm_(algorithm), md_(nullptr), ctx_(nullptr) {
    md_ = fetch_digest(algorithm);
    if (!md_) {
        log::crypto.error() << "Digest " << hash_algorithm_name(algorithm)
                            << " not offered by the OpenSSL provider";
        throw std::runtime_error("Digest not available");
    }
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        release();
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_),
                          static_cast<EVP_MD*>(md_), nullptr) != 1) {
        log::crypto.error("Failed to initialize digest");
        release();
        throw std::runtime_error("Failed to initialize digest");
    }
}

Hasher::~Hasher() {
    release();
}

Hasher::Hasher(Hasher&& other) noexcept
    : algorithm_(other.algorithm_), md_(other.md_), ctx_(other.ctx_) {
    other.md_ = nullptr;
    other.ctx_ = nullptr;
}

Hasher& Hasher::operator=(Hasher&& other) noexcept {
    if (this != &other) {
        release();
        algorithm_ = other.algorithm_;
        md_ = other.md_;
        ctx_ = other.ctx_;
        other.md_ = nullptr;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Hasher::release() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        ctx_ = nullptr;
    }
    if (md_) {
        EVP_MD_free(static_cast<EVP_MD*>(md_));
        md_ = nullptr;
    }
}

void Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void Hasher::update(std::string_view data) {
    update(data.data(), data.size());
}

void Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        log::crypto.error("Digest update failed");
        throw std::runtime_error("Digest update failed");
    }
}

hash_t Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), result.data(), &len) != 1) {
        log::crypto.error("Digest finalize failed");
        throw std::runtime_error("Digest finalize failed");
    }
    return result;
}

void Hasher::reset() {
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_),
                          static_cast<EVP_MD*>(md_), nullptr) != 1) {
        log::crypto.error("Digest reset failed");
        throw std::runtime_error("Digest reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t digest(HashAlgorithm algorithm, std::span<const std::uint8_t> data) {
    Hasher hasher(algorithm);
    hasher.update(data);
    return hasher.finalize();
}

hash_t sha3_256(std::span<const std::uint8_t> data) {
    return sha3_256(data.data(), data.size());
}

hash_t sha3_256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 failed");
        throw std::runtime_error("SHA3-256 failed");
    }
    return result;
}

// ============================================================================
// Randomness
// ============================================================================

hash_t random_hash() {
    hash_t result;
    if (RAND_bytes(result.data(), static_cast<int>(result.size())) != 1) {
        log::crypto.error("RAND_bytes failed");
        throw std::runtime_error("RAND_bytes failed");
    }
    return result;
}

// ============================================================================
// Address from public key (declared in types.hh, implemented here)
// ============================================================================

Address Address::from_public_key(const mldsa_public_key_t& pk) {
    Address addr;
    addr.bytes = sha3_256(pk);
    return addr;
}

}  // namespace mosaic
