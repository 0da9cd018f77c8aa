#include "test_auth.hpp"

#include <algorithm>
#include <cassert>
#include <span>
#include <string_view>

#include "test_support.hpp"
#include "wagerledger/auth/authenticator.hpp"

namespace wagerledger::tests {

namespace {
std::span<const std::byte> as_message(std::string_view text) {
  return std::as_bytes(std::span(text.data(), text.size()));
}
}  // namespace

void test_sign_and_verify() {
  auth::Authenticator authenticator;
  auth::PublicKey public_key{};
  auth::SecretKey secret_key{};
  auth::Authenticator::generate_keypair(public_key, secret_key);

  const auto message = as_message("withdraw 250");
  auth::Signature signature{};
  assert(auth::Authenticator::sign(secret_key, message, signature));
  assert(authenticator.verify(public_key, message, signature));

  assert(!authenticator.verify(public_key, as_message("withdraw 251"), signature));

  auto tampered = signature;
  tampered[0] ^= 0x01;
  assert(!authenticator.verify(public_key, message, tampered));

  auth::PublicKey other_public{};
  auth::SecretKey other_secret{};
  auth::Authenticator::generate_keypair(other_public, other_secret);
  assert(!authenticator.verify(other_public, message, signature));
}

void test_signed_frame_layout() {
  auth::PublicKey public_key{};
  auth::SecretKey secret_key{};
  auth::Authenticator::generate_keypair(public_key, secret_key);

  const auto message = as_message("attest");
  const auto frame = auth::make_signed_frame(public_key, secret_key, message);
  assert(frame.size() == auth::kSignedFrameHeaderSize + message.size());

  const auto split = auth::split_signed_frame(frame);
  assert(split.has_value());
  assert(split->signer == public_key);
  assert(split->message.size() == message.size());
  assert(std::equal(split->message.begin(), split->message.end(), message.begin()));

  auth::Authenticator authenticator;
  assert(authenticator.verify(split->signer, split->message, split->signature));

  // Header only, empty message.
  assert(auth::split_signed_frame(std::span(frame).first(auth::kSignedFrameHeaderSize)).has_value());
  assert(!auth::split_signed_frame(std::span(frame).first(auth::kSignedFrameHeaderSize - 1)).has_value());
}

void test_game_identity_derivation() {
  const auto program_id = make_identity(0xaa);
  const auto game_id = auth::derive_game_identity(program_id, 7);

  assert(auth::derive_game_identity(program_id, 7) == game_id);
  assert(auth::derive_game_identity(program_id, 8) != game_id);
  assert(auth::derive_game_identity(make_identity(0xab), 7) != game_id);
  assert(game_id != program_id);

  const auth::VaultCredential credential(program_id, 7);
  assert(credential.program_id() == program_id);
  assert(credential.seed() == 7);
  assert(credential.signer() == game_id);
}

}  // namespace wagerledger::tests
