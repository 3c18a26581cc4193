#include "crypto.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <spdlog/fmt/fmt.h>
#include <cstring>

namespace crypto {

Algorithm parse_algorithm(const std::string& name) {
    if( name == "aes256gcm-rsa" ){
        return Algorithm::AES256GCM_RSA;
    }
    if( name == "chacha20-rsa" ){
        return Algorithm::CHACHA20_RSA;
    }
    throw std::invalid_argument("unsupported encrypt algorithm: " + name);
}

const char* algorithm_name(Algorithm algo) {
    switch( algo ){
        case Algorithm::AES256GCM_RSA: return "aes256gcm-rsa";
        case Algorithm::CHACHA20_RSA:  return "chacha20-rsa";
    }
    return "?";
}

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if( code == 0 ){
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

namespace {

struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

void ensure(bool ok, const char* what) {
    if( !ok ){
        throw Error(fmt::format("{}: {}", what, openssl_error()));
    }
}

void set_oaep_sha256(EVP_PKEY_CTX* ctx) {
    ensure(EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0, "EVP_PKEY_CTX_set_rsa_padding");
    ensure(EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0, "EVP_PKEY_CTX_set_rsa_oaep_md");
    ensure(EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0, "EVP_PKEY_CTX_set_rsa_mgf1_md");
}

} // namespace

DataEncryptor::DataEncryptor(pkey_ptr key, Algorithm algo) : m_key(std::move(key)), m_algo(algo) {
    if( !m_key ){
        throw std::invalid_argument("DataEncryptor: no key");
    }
}

const EVP_CIPHER* DataEncryptor::cipher() const {
    switch( m_algo ){
        case Algorithm::AES256GCM_RSA: return EVP_aes_256_gcm();
        case Algorithm::CHACHA20_RSA:  return EVP_chacha20_poly1305();
    }
    throw std::invalid_argument("DataEncryptor: unknown algorithm");
}

buf_t DataEncryptor::rsa_encrypt(const uint8_t* data, size_t size) const {
    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(m_key.get(), nullptr));
    ensure(ctx != nullptr, "EVP_PKEY_CTX_new");
    ensure(EVP_PKEY_encrypt_init(ctx.get()) > 0, "EVP_PKEY_encrypt_init");
    set_oaep_sha256(ctx.get());

    size_t out_len = 0;
    ensure(EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, data, size) > 0, "EVP_PKEY_encrypt");
    buf_t result(out_len);
    ensure(EVP_PKEY_encrypt(ctx.get(), result.data(), &out_len, data, size) > 0, "EVP_PKEY_encrypt");
    result.resize(out_len);
    return result;
}

buf_t DataEncryptor::rsa_decrypt(const uint8_t* data, size_t size) const {
    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(m_key.get(), nullptr));
    ensure(ctx != nullptr, "EVP_PKEY_CTX_new");
    ensure(EVP_PKEY_decrypt_init(ctx.get()) > 0, "EVP_PKEY_decrypt_init");
    set_oaep_sha256(ctx.get());

    size_t out_len = 0;
    ensure(EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, data, size) > 0, "rsa decrypt size");
    buf_t result(out_len);
    ensure(EVP_PKEY_decrypt(ctx.get(), result.data(), &out_len, data, size) > 0, "rsa decrypt");
    result.resize(out_len);
    return result;
}

buf_t DataEncryptor::encrypt(const buf_t& plain) const {
    uint8_t data_key[DATA_KEY_LEN];
    uint8_t nonce[NONCE_LEN];
    ensure(RAND_bytes(data_key, sizeof(data_key)) == 1, "RAND_bytes");
    ensure(RAND_bytes(nonce, sizeof(nonce)) == 1, "RAND_bytes");

    const buf_t cipher_key = rsa_encrypt(data_key, sizeof(data_key));
    if( cipher_key.size() > 0xffff ){
        throw Error(fmt::format("encrypted data key too long: {}", cipher_key.size()));
    }

    buf_t out;
    out.reserve(3 + cipher_key.size() + NONCE_LEN + plain.size() + TAG_LEN);
    out.push_back(static_cast<uint8_t>(cipher_key.size() >> 8));
    out.push_back(static_cast<uint8_t>(cipher_key.size() & 0xff));
    out.push_back(static_cast<uint8_t>(NONCE_LEN));
    out.append(cipher_key.data(), cipher_key.size());
    out.append(nonce, NONCE_LEN);

    const size_t ct_pos = out.size();
    out.resize(ct_pos + plain.size() + TAG_LEN);

    cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
    ensure(ctx != nullptr, "EVP_CIPHER_CTX_new");
    ensure(EVP_EncryptInit_ex(ctx.get(), cipher(), nullptr, nullptr, nullptr) == 1, "AEAD init");
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_LEN, nullptr) == 1, "AEAD set iv length");
    ensure(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, data_key, nonce) == 1, "AEAD set key");

    int out_len = 0;
    int total_len = 0;
    if( !plain.empty() ){
        ensure(EVP_EncryptUpdate(ctx.get(), out.data() + ct_pos, &out_len, plain.data(), static_cast<int>(plain.size())) == 1, "AEAD encrypt");
        total_len += out_len;
    }
    ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + ct_pos + total_len, &out_len) == 1, "AEAD final");
    total_len += out_len;
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, TAG_LEN, out.data() + ct_pos + total_len) == 1, "AEAD get tag");

    out.resize(ct_pos + total_len + TAG_LEN);
    OPENSSL_cleanse(data_key, sizeof(data_key));
    return out;
}

buf_t DataEncryptor::decrypt(const buf_t& blob) const {
    if( blob.size() < 3 ){
        throw Error(fmt::format("misformed ciphertext: {} bytes", blob.size()));
    }
    const size_t key_len = (size_t(blob[0]) << 8) | blob[1];
    const size_t nonce_len = blob[2];
    if( nonce_len != NONCE_LEN ){
        throw Error(fmt::format("misformed ciphertext: nonce length {}", nonce_len));
    }
    if( 3 + key_len + nonce_len + TAG_LEN > blob.size() ){
        throw Error(fmt::format("misformed ciphertext: {} bytes, key {} bytes", blob.size(), key_len));
    }

    buf_t data_key = rsa_decrypt(blob.data() + 3, key_len);
    if( data_key.size() != DATA_KEY_LEN ){
        throw Error(fmt::format("decrypted data key has {} bytes, expected {}", data_key.size(), DATA_KEY_LEN));
    }

    const uint8_t* nonce = blob.data() + 3 + key_len;
    const uint8_t* ct = nonce + nonce_len;
    const size_t ct_len = blob.size() - 3 - key_len - nonce_len - TAG_LEN;
    const uint8_t* tag = ct + ct_len;

    buf_t plain(ct_len);
    cipher_ctx_ptr ctx(EVP_CIPHER_CTX_new());
    ensure(ctx != nullptr, "EVP_CIPHER_CTX_new");
    ensure(EVP_DecryptInit_ex(ctx.get(), cipher(), nullptr, nullptr, nullptr) == 1, "AEAD init");
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(nonce_len), nullptr) == 1, "AEAD set iv length");
    ensure(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, data_key.data(), nonce) == 1, "AEAD set key");
    OPENSSL_cleanse(data_key.data(), data_key.size());

    int out_len = 0;
    int total_len = 0;
    if( ct_len ){
        ensure(EVP_DecryptUpdate(ctx.get(), plain.data(), &out_len, ct, static_cast<int>(ct_len)) == 1, "AEAD decrypt");
        total_len += out_len;
    }
    ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, TAG_LEN, const_cast<uint8_t*>(tag)) == 1, "AEAD set tag");
    if( EVP_DecryptFinal_ex(ctx.get(), plain.data() + total_len, &out_len) != 1 ){
        ERR_clear_error();
        throw Error("message authentication failed");
    }
    total_len += out_len;

    plain.resize(total_len);
    return plain;
}

}
