#include "anp/crypto/cipher.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace anp::crypto {

namespace {

std::string openssl_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return what + ": " + buf;
}

// RAII for EVP_CIPHER_CTX
struct CtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        EVP_CIPHER_CTX_free(ctx);
    }
};
using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

CtxPtr new_ctx() {
    CtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError(openssl_error("EVP_CIPHER_CTX_new failed"));
    }
    return ctx;
}

}  // namespace

AesGcmCipher::AesGcmCipher(std::string_view secret) {
    if (secret.empty()) {
        throw CryptoError("encryption secret must not be empty");
    }
    SHA256(reinterpret_cast<const unsigned char*>(secret.data()), secret.size(), key_.data());
}

util::Bytes AesGcmCipher::encrypt(const util::Bytes& plaintext) const {
    util::Bytes out(NONCE_SIZE + plaintext.size() + TAG_SIZE);
    uint8_t* nonce = out.data();
    uint8_t* body = out.data() + NONCE_SIZE;
    uint8_t* tag = body + plaintext.size();

    // fresh random nonce per block; the key never changes over a connection
    if (RAND_bytes(nonce, static_cast<int>(NONCE_SIZE)) != 1) {
        throw CryptoError(openssl_error("RAND_bytes failed"));
    }

    auto ctx = new_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw CryptoError(openssl_error("failed to initialise AES-256-GCM"));
    }

    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), body, &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
        throw CryptoError(openssl_error("encrypt failed"));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), body + len, &final_len) != 1) {
        throw CryptoError(openssl_error("encrypt finalisation failed"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) !=
        1) {
        throw CryptoError(openssl_error("failed to read GCM tag"));
    }
    return out;
}

util::Bytes AesGcmCipher::decrypt(const util::Bytes& ciphertext) const {
    if (ciphertext.size() < OVERHEAD) {
        throw CryptoError("encrypted block too short: " + std::to_string(ciphertext.size()) +
                          " bytes");
    }

    const uint8_t* nonce = ciphertext.data();
    const uint8_t* body = ciphertext.data() + NONCE_SIZE;
    std::size_t body_len = ciphertext.size() - OVERHEAD;
    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer
    util::Bytes tag(ciphertext.end() - TAG_SIZE, ciphertext.end());

    // keep data() non-null for the final call when the plaintext is empty
    util::Bytes out(body_len + 1);

    auto ctx = new_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
        throw CryptoError(openssl_error("failed to initialise AES-256-GCM"));
    }

    int len = 0;
    if (body_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), out.data(), &len, body, static_cast<int>(body_len)) != 1) {
        throw CryptoError(openssl_error("decrypt failed"));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                            tag.data()) != 1) {
        throw CryptoError(openssl_error("failed to set GCM tag"));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
        // tag mismatch: wrong secret or corrupted block
        ERR_clear_error();
        throw CryptoError("authentication failed, block was not encrypted with this secret");
    }
    out.resize(body_len);
    return out;
}

EncryptionConfig EncryptionConfig::from_secret(std::string_view secret) {
    if (secret.empty()) {
        return none();
    }
    return EncryptionConfig(std::make_shared<AesGcmCipher>(secret));
}

}  // namespace anp::crypto
