#ifndef ANP_CRYPTO_CIPHER_HPP
#define ANP_CRYPTO_CIPHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "anp/util/types.hpp"

namespace anp::crypto {

class CryptoError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// payload cipher shared by both ends of a connection
class ICipher {
   public:
    virtual ~ICipher() = default;

    [[nodiscard]] virtual util::Bytes encrypt(const util::Bytes& plaintext) const = 0;
    // throws CryptoError when the data was not produced with the same secret
    [[nodiscard]] virtual util::Bytes decrypt(const util::Bytes& ciphertext) const = 0;
};

/*
    AES-256-GCM keyed by SHA-256(secret).
    output layout: [12 byte nonce][ciphertext, same length as plaintext][16 byte tag]
    so every encrypted block is OVERHEAD bytes longer than its plaintext.
*/
class AesGcmCipher : public ICipher {
   public:
    static constexpr std::size_t KEY_SIZE = 32;
    static constexpr std::size_t NONCE_SIZE = 12;
    static constexpr std::size_t TAG_SIZE = 16;
    static constexpr std::size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;

    explicit AesGcmCipher(std::string_view secret);

    [[nodiscard]] util::Bytes encrypt(const util::Bytes& plaintext) const override;
    [[nodiscard]] util::Bytes decrypt(const util::Bytes& ciphertext) const override;

   private:
    std::array<uint8_t, KEY_SIZE> key_{};
};

// read-only after construction; copied into every codec
class EncryptionConfig {
   public:
    EncryptionConfig() = default;
    explicit EncryptionConfig(std::shared_ptr<const ICipher> cipher) : cipher_(std::move(cipher)) {}

    static EncryptionConfig none() {
        return EncryptionConfig{};
    }

    // empty secret = encryption disabled
    static EncryptionConfig from_secret(std::string_view secret);

    [[nodiscard]] bool enabled() const noexcept {
        return cipher_ != nullptr;
    }

    [[nodiscard]] const ICipher* cipher() const noexcept {
        return cipher_.get();
    }

   private:
    std::shared_ptr<const ICipher> cipher_;
};

}  // namespace anp::crypto

#endif
