#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>
#include <vector>

namespace mosaic {

// ============================================================================
// Hash Algorithms
// ============================================================================

// SHA3-256 is FIPS 202. KECCAK_256 is the pre-standard padding used by
// Ethereum-style tooling (ethers.keccak256); it needs an OpenSSL provider
// that exposes "KECCAK-256" (OpenSSL 3.2 and later).
enum class HashAlgorithm : std::uint8_t {
    SHA3_256 = 0,
    KECCAK_256 = 1,
};

[[nodiscard]] std::string_view hash_algorithm_name(HashAlgorithm algorithm);
[[nodiscard]] bool hash_algorithm_available(HashAlgorithm algorithm);

// ============================================================================
// Streaming Hasher
// ============================================================================

class Hasher {
public:
    explicit Hasher(HashAlgorithm algorithm = HashAlgorithm::SHA3_256);
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;
    Hasher(Hasher&&) noexcept;
    Hasher& operator=(Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view data);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

    void reset();

    [[nodiscard]] HashAlgorithm algorithm() const { return algorithm_; }

private:
    HashAlgorithm algorithm_;
    void* md_;   // EVP_MD*, fetched and owned
    void* ctx_;  // EVP_MD_CTX*

    void release();
};

// Convenience functions
[[nodiscard]] hash_t digest(HashAlgorithm algorithm, std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// Hash multiple inputs, concatenated with no separator
template<typename... Args>
[[nodiscard]] hash_t digest_concat(HashAlgorithm algorithm, Args&&... args) {
    Hasher hasher(algorithm);
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// Randomness
// ============================================================================

// 32 bytes from the OpenSSL CSPRNG; throws std::runtime_error on failure
[[nodiscard]] hash_t random_hash();

}  // namespace mosaic
