#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vaultcore/common/types.hpp"

namespace vaultcore {
namespace auth {

// ed25519 key sizes
constexpr std::size_t kPublicKeySize = 32;
constexpr std::size_t kSecretKeySize = 64;
constexpr std::size_t kSignatureSize = 64;

using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
using SecretKey = std::array<std::uint8_t, kSecretKeySize>;
using Signature = std::array<std::uint8_t, kSignatureSize>;

// A read of `account`'s history issued by `caller`. `nonce` must increase
// with every signed query so that a captured signature cannot be replayed.
// Canonical encoding: [tag:4 'VCHQ'][caller:8 LE][account:8 LE][nonce:8 LE]
struct HistoryQuery {
  common::Principal caller{0};
  common::Principal account{0};
  std::uint64_t nonce{0};

  [[nodiscard]] std::vector<std::byte> encode() const;
};

class Authenticator {
 public:
  Authenticator();
  ~Authenticator();

  // Register the public key a principal signs privileged requests with
  void register_principal(common::Principal principal, const PublicKey& public_key);

  void unregister_principal(common::Principal principal);

  bool has_principal(common::Principal principal) const;

  // Returns std::nullopt if the principal has no key
  std::optional<PublicKey> get_public_key(common::Principal principal) const;

  bool verify(common::Principal principal,
              std::span<const std::byte> message,
              const Signature& signature) const;

  // True if `signature` is the caller's signature over the encoded query
  bool verify_query(const HistoryQuery& query, const Signature& signature) const;

  static bool verify_with_key(const PublicKey& public_key,
                              std::span<const std::byte> message,
                              const Signature& signature);

  // Sign a message with a secret key (for testing/client use)
  static bool sign(const SecretKey& secret_key,
                   std::span<const std::byte> message,
                   Signature& out_signature);

  static Signature sign_query(const SecretKey& secret_key, const HistoryQuery& query);

  // Generate a new keypair (for testing/setup)
  static void generate_keypair(PublicKey& out_public, SecretKey& out_secret);

  // Hex decoding of exactly one key or signature; std::nullopt on any malformed input
  static std::optional<PublicKey> parse_public_key(std::string_view hex);
  static std::optional<Signature> parse_signature(std::string_view hex);

  std::size_t principal_count() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<common::Principal, PublicKey> keys_;
};

}  // namespace auth
}  // namespace vaultcore
