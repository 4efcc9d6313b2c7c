#include "types.hh"
#include <algorithm>
#include <atomic>

namespace mosaic {

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

namespace {

std::optional<std::uint8_t> hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

std::optional<hash_t> hex_to_hash(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != HASH_SIZE) {
        return std::nullopt;
    }
    hash_t h;
    std::copy(bytes_opt->begin(), bytes_opt->end(), h.begin());
    return h;
}

}  // namespace

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

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    // Skip optional 0x prefix
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto high = hex_nibble(hex[i]);
        auto low = hex_nibble(hex[i + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((*high << 4) | *low));
    }

    return result;
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

// ============================================================================
// Address / GameId
// ============================================================================

std::string Address::to_hex() const {
    return "0x" + bytes_to_hex(bytes);
}

std::optional<Address> Address::from_hex(std::string_view hex) {
    auto h = hex_to_hash(hex);
    if (!h) {
        return std::nullopt;
    }
    return Address{*h};
}

std::string GameId::to_hex() const {
    return "0x" + bytes_to_hex(bytes);
}

std::optional<GameId> GameId::from_hex(std::string_view hex) {
    auto h = hex_to_hash(hex);
    if (!h) {
        return std::nullopt;
    }
    return GameId{*h};
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::put_u32(std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    buffer_.insert(buffer_.end(), buf.begin(), buf.end());
}

void ByteWriter::put_u64(std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    buffer_.insert(buffer_.end(), buf.begin(), buf.end());
}

void ByteWriter::put_bytes(std::span<const std::uint8_t> data) {
    put_u32(static_cast<std::uint32_t>(data.size()));
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void ByteWriter::put_string(std::string_view str) {
    put_u32(static_cast<std::uint32_t>(str.size()));
    buffer_.insert(buffer_.end(), str.begin(), str.end());
}

// ============================================================================
// ByteReader
// ============================================================================

std::optional<std::uint8_t> ByteReader::get_u8() {
    if (remaining() < 1) {
        return std::nullopt;
    }
    return data_[offset_++];
}

std::optional<std::uint32_t> ByteReader::get_u32() {
    if (remaining() < sizeof(std::uint32_t)) {
        return std::nullopt;
    }
    auto val = decode_u32(data_.data() + offset_);
    offset_ += sizeof(std::uint32_t);
    return val;
}

std::optional<std::uint64_t> ByteReader::get_u64() {
    if (remaining() < sizeof(std::uint64_t)) {
        return std::nullopt;
    }
    auto val = decode_u64(data_.data() + offset_);
    offset_ += sizeof(std::uint64_t);
    return val;
}

std::optional<hash_t> ByteReader::get_hash() {
    if (remaining() < HASH_SIZE) {
        return std::nullopt;
    }
    hash_t h;
    std::copy(data_.begin() + offset_, data_.begin() + offset_ + HASH_SIZE, h.begin());
    offset_ += HASH_SIZE;
    return h;
}

std::optional<bytes_t> ByteReader::get_bytes(std::size_t max_size) {
    auto len = get_u32();
    if (!len || *len > max_size || *len > remaining()) {
        return std::nullopt;
    }
    bytes_t result(data_.begin() + offset_, data_.begin() + offset_ + *len);
    offset_ += *len;
    return result;
}

std::optional<std::string> ByteReader::get_string(std::size_t max_size) {
    auto len = get_u32();
    if (!len || *len > max_size || *len > remaining()) {
        return std::nullopt;
    }
    std::string result(data_.begin() + offset_, data_.begin() + offset_ + *len);
    offset_ += *len;
    return result;
}

}  // namespace mosaic
