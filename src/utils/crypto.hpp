#pragma once

#include <openssl/evp.h>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/buf_t.hpp"

namespace crypto {

class Error : public std::runtime_error {
    public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

enum class Algorithm {
    AES256GCM_RSA,
    CHACHA20_RSA,
};

// "aes256gcm-rsa", "chacha20-rsa"; throws std::invalid_argument for anything else
Algorithm parse_algorithm(const std::string& name);
const char* algorithm_name(Algorithm algo);

struct PKeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
using pkey_ptr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

// last OpenSSL error as text, empties the error queue
std::string openssl_error();

const size_t DATA_KEY_LEN = 32;
const size_t NONCE_LEN    = 12;
const size_t TAG_LEN      = 16;

// Per-object envelope encryption:
//   [keylen hi][keylen lo][nonce len][RSA-OAEP(SHA-256) data key][nonce][AEAD ciphertext][tag]
// A fresh random data key and nonce are used for every object.
class DataEncryptor {
    public:
    DataEncryptor(pkey_ptr key, Algorithm algo);

    buf_t encrypt(const buf_t& plain) const;
    buf_t decrypt(const buf_t& blob) const;

    Algorithm algorithm() const { return m_algo; }

    private:
    buf_t rsa_encrypt(const uint8_t* data, size_t size) const;
    buf_t rsa_decrypt(const uint8_t* data, size_t size) const;
    const EVP_CIPHER* cipher() const;

    pkey_ptr m_key;
    Algorithm m_algo;
};

}
