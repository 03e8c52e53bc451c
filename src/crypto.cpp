#include "scrubby/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <format>

namespace scrubby::crypto
{

    namespace
    {
        Result<void> sodium_ready()
        {
            static const bool ok = sodium_init() >= 0;
            if (!ok)
                return std::unexpected(ScrubbyError::crypto("libsodium could not be initialized"));
            return {};
        }

        template <std::size_t N>
        Result<std::array<uint8_t, N>> decode_exact(const std::string &b64, std::string_view what)
        {
            auto raw = Base64::decode(b64);
            if (!raw)
                return std::unexpected(raw.error());
            if (raw->size() != N)
            {
                return std::unexpected(ScrubbyError::crypto(
                    std::format("{} must be {} bytes, got {}", what, N, raw->size())));
            }
            std::array<uint8_t, N> out{};
            std::copy_n(raw->begin(), N, out.begin());
            return out;
        }

        SHA256Hash digest(const uint8_t *data, std::size_t size)
        {
            SHA256Hash out{};
            crypto_hash_sha256(out.data(), data, size);
            return out;
        }
    } // namespace

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        if (auto ready = sodium_ready(); !ready)
            return std::unexpected(ready.error());

        Ed25519KeyPair pair;
        if (crypto_sign_keypair(pair.public_key.data(), pair.secret_key.data()) != 0)
            return std::unexpected(ScrubbyError::crypto("Ed25519 key generation failed"));
        return pair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const Ed25519Seed &seed)
    {
        if (auto ready = sodium_ready(); !ready)
            return std::unexpected(ready.error());

        Ed25519KeyPair pair;
        if (crypto_sign_seed_keypair(pair.public_key.data(), pair.secret_key.data(), seed.data()) != 0)
            return std::unexpected(ScrubbyError::crypto("Ed25519 seed expansion failed"));
        return pair;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature sig{};
        crypto_sign_detached(sig.data(), nullptr, message.data(), message.size(), secret_key.data());
        return sig;
    }

    bool Ed25519KeyPair::verify(const Bytes &message,
                                const Ed25519Signature &signature,
                                const Ed25519PublicKey &public_key)
    {
        if (!sodium_ready())
            return false;
        return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                           public_key.data()) == 0;
    }

    Result<Ed25519PublicKey> public_key_from_base64(const std::string &b64)
    {
        return decode_exact<crypto_sign_PUBLICKEYBYTES>(b64, "Public key");
    }

    Result<Ed25519Signature> signature_from_base64(const std::string &b64)
    {
        return decode_exact<crypto_sign_BYTES>(b64, "Signature");
    }

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        return digest(data.data(), data.size());
    }

    SHA256Hash SHA256::hash(std::string_view data)
    {
        return digest(reinterpret_cast<const uint8_t *>(data.data()), data.size());
    }

    std::string SHA256::to_hex(const SHA256Hash &hash, std::size_t bytes)
    {
        bytes = std::min(bytes, hash.size());
        std::vector<char> buf(bytes * 2 + 1);
        sodium_bin2hex(buf.data(), buf.size(), hash.data(), bytes);
        return std::string(buf.data(), bytes * 2);
    }

    std::string Base64::encode(const Bytes &data)
    {
        const std::size_t cap = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::vector<char> buf(cap);
        sodium_bin2base64(buf.data(), cap, data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        // cap counts the trailing NUL
        return std::string(buf.data(), cap - 1);
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes out(encoded.size() / 4 * 3 + 3);
        std::size_t written = 0;
        const char *stop = nullptr;
        const char *last = encoded.data() + encoded.size();

        const int rc = sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                                         nullptr, &written, &stop, sodium_base64_VARIANT_ORIGINAL);
        if (rc != 0 || stop != last)
            return std::unexpected(ScrubbyError::crypto("Malformed base64 input"));

        out.resize(written);
        return out;
    }

} // namespace scrubby::crypto
