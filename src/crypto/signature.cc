#include "signature.hh"
#include "core/logging.hh"
#include <oqs/oqs.h>

namespace mosaic {

namespace {

struct OqsSigDeleter {
    void operator()(OQS_SIG* sig) const { OQS_SIG_free(sig); }
};

using OqsSig = std::unique_ptr<OQS_SIG, OqsSigDeleter>;

OqsSig new_mldsa65() {
    OqsSig sig(OQS_SIG_new(OQS_SIG_alg_ml_dsa_65));
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context");
    }
    return sig;
}

}  // namespace

// ============================================================================
// ML-DSA-65 Implementation
// ============================================================================

MLDSAKeyPair::~MLDSAKeyPair() {
    if (secret_key_) {
        secure_zero(*secret_key_);
    }
}

MLDSAKeyPair::MLDSAKeyPair(MLDSAKeyPair&& other) noexcept
    : public_key_(other.public_key_)
    , secret_key_(std::move(other.secret_key_)) {}

MLDSAKeyPair& MLDSAKeyPair::operator=(MLDSAKeyPair&& other) noexcept {
    if (this != &other) {
        if (secret_key_) {
            secure_zero(*secret_key_);
        }
        public_key_ = other.public_key_;
        secret_key_ = std::move(other.secret_key_);
    }
    return *this;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::generate() {
    auto sig = new_mldsa65();
    if (!sig) {
        return std::nullopt;
    }

    MLDSAKeyPair keypair;
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>();

    if (OQS_SIG_keypair(sig.get(), keypair.public_key_.data(),
                        keypair.secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 key generation failed");
        return std::nullopt;
    }

    MOSAIC_LOG_DEBUG(log::crypto) << "Generated ML-DSA-65 keypair for "
                                  << keypair.address().to_hex();
    return keypair;
}

MLDSAKeyPair MLDSAKeyPair::from_keys(
    const mldsa_public_key_t& pk, const mldsa_secret_key_t& sk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = pk;
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>(sk);
    return keypair;
}

MLDSAKeyPair MLDSAKeyPair::from_public_key(const mldsa_public_key_t& pk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = pk;
    return keypair;
}

std::optional<mldsa_signature_t> MLDSAKeyPair::sign(
    std::span<const std::uint8_t> message) const {
    if (!secret_key_) {
        log::crypto.warn("Attempted to sign without secret key");
        return std::nullopt;
    }

    auto sig = new_mldsa65();
    if (!sig) {
        return std::nullopt;
    }

    mldsa_signature_t signature{};
    std::size_t sig_len = MLDSA65_SIGNATURE_SIZE;

    if (OQS_SIG_sign(sig.get(), signature.data(), &sig_len,
                     message.data(), message.size(),
                     secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 signing failed");
        return std::nullopt;
    }

    MOSAIC_LOG_TRACE(log::crypto) << "Signed message of " << message.size() << " bytes";
    return signature;
}

bool MLDSAKeyPair::verify(std::span<const std::uint8_t> message,
                          const mldsa_signature_t& signature) const {
    return mldsa_verify(public_key_, message, signature);
}

bool mldsa_verify(const mldsa_public_key_t& public_key,
                  std::span<const std::uint8_t> message,
                  const mldsa_signature_t& signature) {
    auto sig = new_mldsa65();
    if (!sig) {
        return false;
    }

    bool result = OQS_SIG_verify(sig.get(), message.data(), message.size(),
                                 signature.data(), MLDSA65_SIGNATURE_SIZE,
                                 public_key.data()) == OQS_SUCCESS;

    if (!result) {
        MOSAIC_LOG_DEBUG(log::crypto) << "ML-DSA-65 signature verification failed";
    }
    return result;
}

}  // namespace mosaic
