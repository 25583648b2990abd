#include "vaultcore/auth/authenticator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace vaultcore {
namespace auth {

namespace {

constexpr std::array<std::byte, 4> kHistoryQueryTag{std::byte{'V'}, std::byte{'C'}, std::byte{'H'}, std::byte{'Q'}};

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

void append_le64(std::vector<std::byte>& out, std::uint64_t value) {
  for (int shift = 0; shift < 64; shift += 8) {
    out.push_back(static_cast<std::byte>((value >> shift) & 0xff));
  }
}

template <std::size_t N>
std::optional<std::array<std::uint8_t, N>> parse_hex(std::string_view hex) {
  ensure_sodium_init();

  if (hex.size() != N * 2) {
    return std::nullopt;
  }

  std::array<std::uint8_t, N> bytes{};
  std::size_t decoded = 0;
  const char* end = nullptr;
  if (sodium_hex2bin(bytes.data(), bytes.size(), hex.data(), hex.size(), nullptr, &decoded, &end) != 0) {
    return std::nullopt;
  }
  if (decoded != N || end != hex.data() + hex.size()) {
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

std::vector<std::byte> HistoryQuery::encode() const {
  std::vector<std::byte> out;
  out.reserve(kHistoryQueryTag.size() + 24);
  out.insert(out.end(), kHistoryQueryTag.begin(), kHistoryQueryTag.end());
  append_le64(out, caller);
  append_le64(out, account);
  append_le64(out, nonce);
  return out;
}

Authenticator::Authenticator() {
  ensure_sodium_init();
}

Authenticator::~Authenticator() = default;

void Authenticator::register_principal(common::Principal principal, const PublicKey& public_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_[principal] = public_key;
}

void Authenticator::unregister_principal(common::Principal principal) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(principal);
}

bool Authenticator::has_principal(common::Principal principal) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.find(principal) != keys_.end();
}

std::optional<PublicKey> Authenticator::get_public_key(common::Principal principal) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = keys_.find(principal);
  if (it == keys_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Authenticator::verify(common::Principal principal,
                           std::span<const std::byte> message,
                           const Signature& signature) const {
  const auto key = get_public_key(principal);
  if (!key) {
    return false;
  }
  return verify_with_key(*key, message, signature);
}

bool Authenticator::verify_query(const HistoryQuery& query, const Signature& signature) const {
  const auto message = query.encode();
  return verify(query.caller, message, signature);
}

bool Authenticator::verify_with_key(const PublicKey& public_key,
                                    std::span<const std::byte> message,
                                    const Signature& signature) {
  ensure_sodium_init();

  return crypto_sign_verify_detached(
             signature.data(),
             reinterpret_cast<const unsigned char*>(message.data()),
             message.size(),
             public_key.data()) == 0;
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

Signature Authenticator::sign_query(const SecretKey& secret_key, const HistoryQuery& query) {
  Signature signature{};
  const auto message = query.encode();
  if (!sign(secret_key, message, signature)) {
    throw std::runtime_error("failed to sign history query");
  }
  return signature;
}

void Authenticator::generate_keypair(PublicKey& out_public, SecretKey& out_secret) {
  ensure_sodium_init();
  crypto_sign_keypair(out_public.data(), out_secret.data());
}

std::optional<PublicKey> Authenticator::parse_public_key(std::string_view hex) {
  return parse_hex<kPublicKeySize>(hex);
}

std::optional<Signature> Authenticator::parse_signature(std::string_view hex) {
  return parse_hex<kSignatureSize>(hex);
}

std::size_t Authenticator::principal_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

}  // namespace auth
}  // namespace vaultcore
