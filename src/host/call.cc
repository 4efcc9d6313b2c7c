#include "call.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include <algorithm>
#include <array>

namespace mosaic {

namespace {

constexpr std::string_view CALL_DOMAIN = "mosaic.call.v1";

}  // namespace

// ============================================================================
// Argument Encoding
// ============================================================================

std::vector<std::uint8_t> RequestRevealArgs::serialize() const {
    ByteWriter writer;
    writer.put_u64(tile_index);
    writer.put_u64(payment);
    return writer.take();
}

std::optional<RequestRevealArgs> RequestRevealArgs::deserialize(
    std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    auto tile = reader.get_u64();
    auto payment = reader.get_u64();
    if (!tile || !payment || !reader.at_end()) {
        return std::nullopt;
    }
    return RequestRevealArgs{*tile, *payment};
}

std::vector<std::uint8_t> CommitGuessArgs::serialize() const {
    ByteWriter writer;
    writer.put_hash(digest);
    return writer.take();
}

std::optional<CommitGuessArgs> CommitGuessArgs::deserialize(
    std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    auto digest = reader.get_hash();
    if (!digest || !reader.at_end()) {
        return std::nullopt;
    }
    return CommitGuessArgs{*digest};
}

std::vector<std::uint8_t> SolveArgs::serialize() const {
    ByteWriter writer;
    writer.put_bytes(answer);
    writer.put_bytes(player_salt);
    writer.put_bytes(game_salt);
    return writer.take();
}

std::optional<SolveArgs> SolveArgs::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    auto answer = reader.get_bytes();
    auto player_salt = reader.get_bytes();
    auto game_salt = reader.get_bytes();
    if (!answer || !player_salt || !game_salt || !reader.at_end()) {
        return std::nullopt;
    }
    return SolveArgs{std::move(*answer), std::move(*player_salt), std::move(*game_salt)};
}

std::vector<std::uint8_t> FulfillRevealArgs::serialize() const {
    ByteWriter writer;
    writer.put_u64(tile_index);
    writer.put_bytes(key);
    return writer.take();
}

std::optional<FulfillRevealArgs> FulfillRevealArgs::deserialize(
    std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    auto tile = reader.get_u64();
    auto key = reader.get_bytes();
    if (!tile || !key || !reader.at_end()) {
        return std::nullopt;
    }
    return FulfillRevealArgs{*tile, std::move(*key)};
}

std::vector<std::uint8_t> TransferCapabilityArgs::serialize() const {
    ByteWriter writer;
    writer.put_hash(recipient.bytes);
    return writer.take();
}

std::optional<TransferCapabilityArgs> TransferCapabilityArgs::deserialize(
    std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    auto recipient = reader.get_hash();
    if (!recipient || !reader.at_end()) {
        return std::nullopt;
    }
    return TransferCapabilityArgs{Address{*recipient}};
}

// ============================================================================
// SignedCall Implementation
// ============================================================================

hash_t SignedCall::signing_hash() const {
    Hasher hasher(HashAlgorithm::SHA3_256);
    hasher.update(CALL_DOMAIN);

    std::array<std::uint8_t, 8> buf;
    hasher.update(&version, 1);
    std::uint8_t kind_byte = static_cast<std::uint8_t>(kind);
    hasher.update(&kind_byte, 1);
    hasher.update(game_id.bytes);

    encode_u64(buf.data(), args.size());
    hasher.update(buf);
    hasher.update(args);

    hasher.update(sender);
    encode_u64(buf.data(), nonce);
    hasher.update(buf);

    return hasher.finalize();
}

Address SignedCall::sender_address() const {
    return Address::from_public_key(sender);
}

bool SignedCall::verify_signature() const {
    hash_t msg = signing_hash();
    return mldsa_verify(sender, msg, signature);
}

std::vector<std::uint8_t> SignedCall::serialize() const {
    ByteWriter writer;
    writer.put_u8(version);
    writer.put_u8(static_cast<std::uint8_t>(kind));
    writer.put_hash(game_id.bytes);
    writer.put_bytes(args);
    std::vector<std::uint8_t> result = writer.take();

    result.insert(result.end(), sender.begin(), sender.end());
    std::array<std::uint8_t, 8> nonce_bytes;
    encode_u64(nonce_bytes.data(), nonce);
    result.insert(result.end(), nonce_bytes.begin(), nonce_bytes.end());
    result.insert(result.end(), signature.begin(), signature.end());
    return result;
}

std::optional<SignedCall> SignedCall::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);

    auto version = reader.get_u8();
    auto kind = reader.get_u8();
    auto game = reader.get_hash();
    auto args = reader.get_bytes(MAX_CALL_ARGS_SIZE);
    if (!version || *version != VERSION || !kind || !game || !args) {
        return std::nullopt;
    }
    if (*kind < static_cast<std::uint8_t>(CallKind::CREATE_GAME) ||
        *kind > static_cast<std::uint8_t>(CallKind::TRANSFER_CAPABILITY)) {
        return std::nullopt;
    }

    constexpr std::size_t TAIL_SIZE = MLDSA65_PUBLIC_KEY_SIZE + 8 + MLDSA65_SIGNATURE_SIZE;
    if (reader.remaining() != TAIL_SIZE) {
        return std::nullopt;
    }

    SignedCall call;
    call.version = *version;
    call.kind = static_cast<CallKind>(*kind);
    call.game_id.bytes = *game;
    call.args = std::move(*args);

    const std::uint8_t* ptr = data.data() + (data.size() - TAIL_SIZE);
    std::copy(ptr, ptr + MLDSA65_PUBLIC_KEY_SIZE, call.sender.begin());
    ptr += MLDSA65_PUBLIC_KEY_SIZE;

    call.nonce = decode_u64(ptr);
    ptr += 8;

    std::copy(ptr, ptr + MLDSA65_SIGNATURE_SIZE, call.signature.begin());
    return call;
}

std::optional<SignedCall> sign_call(const MLDSAKeyPair& keypair,
                                    CallKind kind,
                                    const GameId& game_id,
                                    std::vector<std::uint8_t> args,
                                    nonce_t nonce) {
    SignedCall call;
    call.kind = kind;
    call.game_id = game_id;
    call.args = std::move(args);
    call.sender = keypair.public_key();
    call.nonce = nonce;

    hash_t msg = call.signing_hash();
    auto signature = keypair.sign(msg);
    if (!signature) {
        return std::nullopt;
    }
    call.signature = *signature;
    return call;
}

}  // namespace mosaic
