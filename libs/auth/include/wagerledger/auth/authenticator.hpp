#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "wagerledger/common/types.hpp"

namespace wagerledger {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = common::kIdentitySize;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = common::Identity;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// The program that owns the game vault. Seeds are only meaningful under it.
using ProgramId = common::Identity;

class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  // Verify a detached signature made by the holder of `signer`'s secret key
  bool verify(const PublicKey& signer,
              std::span<const std::byte> message,
              const Signature& signature) const;

  // Sign a message with a secret key (for testing/client use)
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  // Generate a new keypair (for testing/setup)
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);
};

// Signed frame wire format:
// [signer:32][signature:64][message:N]
// The signature covers the message only.
struct SignedFrame {
  PublicKey signer{};
  Signature signature{};
  std::span<const std::byte> message{};
};

constexpr std::size_t kSignedFrameHeaderSize = kPublicKeySize + kSignatureSize;

// Returns nullopt if the frame is shorter than the header.
std::optional<SignedFrame> split_signed_frame(std::span<const std::byte> frame);

std::vector<std::byte> make_signed_frame(const PublicKey& signer,
                                         const SecretKey& secret_key,
                                         std::span<const std::byte> message);

// BLAKE2b-256 over program_id || "game" || seed. The result owns the game's
// vault token account and the game's operating ledger account.
common::Identity derive_game_identity(const ProgramId& program_id, common::Seed seed);

// Proof that the holder controls the vault derived from (program_id, seed).
// Kept apart from the game's ledger record so that code which moves tokens
// out of the vault has to be handed one explicitly.
class VaultCredential {
 public:
  VaultCredential(const ProgramId& program_id, common::Seed seed);

  [[nodiscard]] const ProgramId& program_id() const noexcept { return program_id_; }
  [[nodiscard]] common::Seed seed() const noexcept { return seed_; }
  [[nodiscard]] const common::Identity& signer() const noexcept { return signer_; }

  // True if re-deriving from the stored program id and seed yields `owner`.
  [[nodiscard]] bool authorizes(const common::Identity& owner) const;

 private:
  ProgramId program_id_;
  common::Seed seed_;
  common::Identity signer_;
};

}  // namespace auth
}  // namespace wagerledger
