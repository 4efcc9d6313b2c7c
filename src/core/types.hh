#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace mosaic {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// ML-DSA-65 (FIPS 204), used to authenticate callers at the host boundary
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;  // From liboqs OQS_SIG_ml_dsa_65_length_signature

// SHA3-256 / Keccak-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Address size (same as hash for address derivation)
inline constexpr std::size_t ADDRESS_SIZE = HASH_SIZE;

// ============================================================================
// Game Defaults
// ============================================================================

inline constexpr std::uint32_t DEFAULT_TILE_COUNT = 100;          // 10 x 10 grid
inline constexpr std::uint64_t DEFAULT_TILE_PRICE = 1'000;        // base units per reveal
inline constexpr std::uint64_t DEFAULT_MIN_REVEAL_DELAY_US = 2'000'000;  // 2 seconds

// Upper bounds enforced when decoding untrusted input
inline constexpr std::uint32_t MAX_TILE_COUNT = 10'000;
inline constexpr std::size_t MAX_BLOB_SIZE = 64 * 1024;           // key, secret, answer, salt
inline constexpr std::size_t MAX_HANDLE_SIZE = 1024;              // manifest handle, unlock ref
inline constexpr std::size_t MAX_CALL_ARGS_SIZE = 4 * 1024 * 1024;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using bytes_t = std::vector<std::uint8_t>;
using amount_t = std::uint64_t;
using nonce_t = std::uint64_t;
using tile_index_t = std::uint64_t;

using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

// ============================================================================
// Address (derived from public key hash)
// ============================================================================

struct Address {
    hash_t bytes{};

    [[nodiscard]] static Address from_public_key(const mldsa_public_key_t& pk);
    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Address&) const = default;
};

// ============================================================================
// Game Identifier
// ============================================================================

struct GameId {
    hash_t bytes{};

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<GameId> from_hex(std::string_view hex);

    auto operator<=>(const GameId&) const = default;
};

// ============================================================================
// Time Utilities
// ============================================================================

using timestamp_t = std::chrono::microseconds;

[[nodiscard]] inline timestamp_t system_now() {
    return std::chrono::duration_cast<timestamp_t>(
        std::chrono::system_clock::now().time_since_epoch());
}

// ============================================================================
// Status Codes
// ============================================================================

enum class GameStatus : std::uint8_t {
    SUCCESS = 0x00,
    ALREADY_SOLVED = 0x01,
    INVALID_PAYMENT = 0x02,         // Wrong reveal price or malformed construction vectors
    INVALID_TILE_INDEX = 0x03,
    TILE_ALREADY_REVEALED = 0x04,
    NO_COMMITMENT_FOUND = 0x05,
    INCORRECT_ANSWER = 0x06,
    COMMITMENT_TOO_FRESH = 0x07,    // Reveal before the minimum delay elapsed
    COMMITMENT_STALE = 0x08,        // Reveal after the maximum commitment age
    UNAUTHORIZED = 0x09,            // Capability missing or bound to another system
    GAME_ALREADY_EXISTS = 0x0A,     // Restore target id is already registered

    // Host boundary
    GAME_NOT_FOUND = 0x10,
    INVALID_SIGNATURE = 0x11,
    INVALID_NONCE = 0x12,
    INSUFFICIENT_BALANCE = 0x13,
    MALFORMED_CALL = 0x14,
};

[[nodiscard]] inline std::string_view game_status_string(GameStatus status) {
    switch (status) {
        case GameStatus::SUCCESS: return "success";
        case GameStatus::ALREADY_SOLVED: return "already_solved";
        case GameStatus::INVALID_PAYMENT: return "invalid_payment";
        case GameStatus::INVALID_TILE_INDEX: return "invalid_tile_index";
        case GameStatus::TILE_ALREADY_REVEALED: return "tile_already_revealed";
        case GameStatus::NO_COMMITMENT_FOUND: return "no_commitment_found";
        case GameStatus::INCORRECT_ANSWER: return "incorrect_answer";
        case GameStatus::COMMITMENT_TOO_FRESH: return "commitment_too_fresh";
        case GameStatus::COMMITMENT_STALE: return "commitment_stale";
        case GameStatus::UNAUTHORIZED: return "unauthorized";
        case GameStatus::GAME_ALREADY_EXISTS: return "game_already_exists";
        case GameStatus::GAME_NOT_FOUND: return "game_not_found";
        case GameStatus::INVALID_SIGNATURE: return "invalid_signature";
        case GameStatus::INVALID_NONCE: return "invalid_nonce";
        case GameStatus::INSUFFICIENT_BALANCE: return "insufficient_balance";
        case GameStatus::MALFORMED_CALL: return "malformed_call";
    }
    return "unknown";
}

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
    for (int i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
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
    for (int i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

// ============================================================================
// Byte Writer / Reader
// ============================================================================

// Appends little-endian fields and u32-length-prefixed blobs to a buffer
class ByteWriter {
public:
    void put_u8(std::uint8_t val) { buffer_.push_back(val); }
    void put_u32(std::uint32_t val);
    void put_u64(std::uint64_t val);
    void put_hash(const hash_t& h) { buffer_.insert(buffer_.end(), h.begin(), h.end()); }
    void put_bytes(std::span<const std::uint8_t> data);
    void put_string(std::string_view str);

    [[nodiscard]] std::vector<std::uint8_t> take() { return std::move(buffer_); }

private:
    std::vector<std::uint8_t> buffer_;
};

// Bounds-checked counterpart of ByteWriter; every getter returns nullopt on underrun
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    [[nodiscard]] std::optional<std::uint8_t> get_u8();
    [[nodiscard]] std::optional<std::uint32_t> get_u32();
    [[nodiscard]] std::optional<std::uint64_t> get_u64();
    [[nodiscard]] std::optional<hash_t> get_hash();
    [[nodiscard]] std::optional<bytes_t> get_bytes(std::size_t max_size = MAX_BLOB_SIZE);
    [[nodiscard]] std::optional<std::string> get_string(std::size_t max_size = MAX_HANDLE_SIZE);

    [[nodiscard]] std::size_t remaining() const { return data_.size() - offset_; }
    [[nodiscard]] bool at_end() const { return offset_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

[[nodiscard]] inline bytes_t to_bytes(std::string_view str) {
    return bytes_t(str.begin(), str.end());
}

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace mosaic

// ============================================================================
// Hash specializations (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<mosaic::hash_t> {
    std::size_t operator()(const mosaic::hash_t& h) const noexcept {
        // Use first 8 bytes as hash (already cryptographic quality)
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<mosaic::Address> {
    std::size_t operator()(const mosaic::Address& addr) const noexcept {
        return std::hash<mosaic::hash_t>{}(addr.bytes);
    }
};

template<>
struct hash<mosaic::GameId> {
    std::size_t operator()(const mosaic::GameId& id) const noexcept {
        return std::hash<mosaic::hash_t>{}(id.bytes);
    }
};

}  // namespace std
