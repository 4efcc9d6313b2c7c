#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace mosaic {

class MLDSAKeyPair;

// ============================================================================
// Call Kinds
// ============================================================================

enum class CallKind : std::uint8_t {
    CREATE_GAME = 0x01,           // args: GameSetup
    REQUEST_REVEAL = 0x02,        // args: RequestRevealArgs
    COMMIT_GUESS = 0x03,          // args: CommitGuessArgs
    SOLVE = 0x04,                 // args: SolveArgs
    FULFILL_REVEAL = 0x05,        // args: FulfillRevealArgs
    TRANSFER_CAPABILITY = 0x06,   // args: TransferCapabilityArgs
};

[[nodiscard]] inline std::string_view call_kind_string(CallKind kind) {
    switch (kind) {
        case CallKind::CREATE_GAME: return "create_game";
        case CallKind::REQUEST_REVEAL: return "request_reveal";
        case CallKind::COMMIT_GUESS: return "commit_guess";
        case CallKind::SOLVE: return "solve";
        case CallKind::FULFILL_REVEAL: return "fulfill_reveal";
        case CallKind::TRANSFER_CAPABILITY: return "transfer_capability";
    }
    return "unknown";
}

// ============================================================================
// Call Arguments
// ============================================================================

struct RequestRevealArgs {
    tile_index_t tile_index = 0;
    amount_t payment = 0;   // Withdrawn from the sender's balance

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<RequestRevealArgs> deserialize(
        std::span<const std::uint8_t> data);
};

struct CommitGuessArgs {
    hash_t digest{};

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<CommitGuessArgs> deserialize(
        std::span<const std::uint8_t> data);
};

struct SolveArgs {
    bytes_t answer;
    bytes_t player_salt;
    bytes_t game_salt;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<SolveArgs> deserialize(
        std::span<const std::uint8_t> data);
};

struct FulfillRevealArgs {
    tile_index_t tile_index = 0;
    bytes_t key;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<FulfillRevealArgs> deserialize(
        std::span<const std::uint8_t> data);
};

struct TransferCapabilityArgs {
    Address recipient;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<TransferCapabilityArgs> deserialize(
        std::span<const std::uint8_t> data);
};

// ============================================================================
// Signed Call
// ============================================================================

struct SignedCall {
    static constexpr std::uint8_t VERSION = 1;

    std::uint8_t version = VERSION;
    CallKind kind = CallKind::CREATE_GAME;
    GameId game_id;                  // Zero for CREATE_GAME and TRANSFER_CAPABILITY
    std::vector<std::uint8_t> args;  // Encoded argument struct for `kind`
    mldsa_public_key_t sender{};
    nonce_t nonce = 0;
    mldsa_signature_t signature{};

    // SHA3-256 over every field except the signature
    [[nodiscard]] hash_t signing_hash() const;

    [[nodiscard]] Address sender_address() const;
    [[nodiscard]] bool verify_signature() const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<SignedCall> deserialize(
        std::span<const std::uint8_t> data);
};

// Build and sign a call; nullopt if the key pair cannot sign
[[nodiscard]] std::optional<SignedCall> sign_call(const MLDSAKeyPair& keypair,
                                                  CallKind kind,
                                                  const GameId& game_id,
                                                  std::vector<std::uint8_t> args,
                                                  nonce_t nonce);

}  // namespace mosaic
