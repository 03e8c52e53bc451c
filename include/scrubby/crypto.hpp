#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Thin libsodium wrappers used for license signatures and device ids.
namespace scrubby::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    using Ed25519Seed = std::array<uint8_t, 32>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;

    /**
     * The binary only verifies license signatures. Key generation and signing
     * exist so tests can issue licenses against a known key.
     */
    struct Ed25519KeyPair
    {
        Ed25519PublicKey public_key{};
        Ed25519SecretKey secret_key{};

        static Result<Ed25519KeyPair> generate();
        static Result<Ed25519KeyPair> from_seed(const Ed25519Seed &seed);

        Ed25519Signature sign(const Bytes &message) const;

        // False for any bad signature, including one made with another key.
        static bool verify(const Bytes &message,
                           const Ed25519Signature &signature,
                           const Ed25519PublicKey &public_key);
    };

    // Both reject input that does not decode to exactly the key or signature size.
    Result<Ed25519PublicKey> public_key_from_base64(const std::string &b64);
    Result<Ed25519Signature> signature_from_base64(const std::string &b64);

    struct SHA256
    {
        static SHA256Hash hash(const Bytes &data);
        static SHA256Hash hash(std::string_view data);

        // Lower-case hex of the leading `bytes` bytes.
        static std::string to_hex(const SHA256Hash &hash, std::size_t bytes = 32);
    };

    // Standard alphabet with padding. Decoding fails on any trailing garbage.
    struct Base64
    {
        static std::string encode(const Bytes &data);
        static Result<Bytes> decode(const std::string &encoded);
    };

} // namespace scrubby::crypto
