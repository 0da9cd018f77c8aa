#include "wagerledger/auth/authenticator.hpp"

#include <sodium.h>

#include <cstring>
#include <stdexcept>

namespace wagerledger {
namespace auth {

namespace {

constexpr char kGameSeedLabel[] = "game";

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

// Ensure sodium is initialized before any crypto operations
void ensure_sodium_init() {
  static SodiumInitializer init;
}

}  // namespace

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

bool Authenticator::verify(const PublicKey& signer,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             signer.data()) == 0;
}

bool Authenticator::sign(const SecretKey& secret_key,
                         std::span<const std::byte> message,
                         Signature& out_signature) {
  ensure_sodium_init();

  return crypto_sign_detached(
             out_signature.data(),
             nullptr,
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             secret_key.data()) == 0;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

std::optional<SignedFrame> split_signed_frame(std::span<const std::byte> frame) {
  if (frame.size() < kSignedFrameHeaderSize) {
    return std::nullopt;
  }

  SignedFrame out;
  std::memcpy(out.signer.data(), frame.data(), kPublicKeySize);
  std::memcpy(out.signature.data(), frame.data() + kPublicKeySize, kSignatureSize);
  out.message = frame.subspan(kSignedFrameHeaderSize);
  return out;
}

std::vector<std::byte> make_signed_frame(const PublicKey& signer,
                                         const SecretKey& secret_key,
                                         std::span<const std::byte> message) {
  Signature signature{};
  if (!Authenticator::sign(secret_key, message, signature)) {
    throw std::runtime_error("failed to sign request frame");
  }

  std::vector<std::byte> frame;
  frame.reserve(kSignedFrameHeaderSize + message.size());
  const auto* signer_bytes = reinterpret_cast<const std::byte*>(signer.data());
  frame.insert(frame.end(), signer_bytes, signer_bytes + kPublicKeySize);
  const auto* signature_bytes = reinterpret_cast<const std::byte*>(signature.data());
  frame.insert(frame.end(), signature_bytes, signature_bytes + kSignatureSize);
  frame.insert(frame.end(), message.begin(), message.end());
  return frame;
}

common::Identity derive_game_identity(const ProgramId& program_id, common::Seed seed) {
  ensure_sodium_init();

  crypto_generichash_state state;
  common::Identity out{};
  if (crypto_generichash_init(&state, nullptr, 0, out.size()) != 0) {
    throw std::runtime_error("crypto_generichash_init failed");
  }
  crypto_generichash_update(&state, program_id.data(), program_id.size());
  crypto_generichash_update(&state,
                            reinterpret_cast<const unsigned char*>(kGameSeedLabel),
                            sizeof(kGameSeedLabel) - 1);
  crypto_generichash_update(&state, &seed, 1);
  crypto_generichash_final(&state, out.data(), out.size());
  return out;
}

VaultCredential::VaultCredential(const ProgramId& program_id, common::Seed seed)
    : program_id_(program_id), seed_(seed), signer_(derive_game_identity(program_id, seed)) {}

bool VaultCredential::authorizes(const common::Identity& owner) const {
  return derive_game_identity(program_id_, seed_) == owner;
}

}  // namespace auth
}  // namespace wagerledger
