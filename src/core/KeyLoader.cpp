/**
 * @file KeyLoader.cpp
 * @brief Private key resolution for encrypted backups.
 *
 * The key reference is either the PEM text itself or a path to a PEM file.
 * A passphrase-protected key without a passphrase is rejected before OpenSSL
 * ever tries to decrypt it, so the user gets an actionable message instead
 * of a bad-decrypt error.
 */

#include "KeyLoader.hpp"
#include "errors.hpp"
#include "utils/common.hpp"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

DecodeSpec DecodeSpec::from_env(const std::string& source, const std::string& key_ref, crypto::Algorithm algo) {
    DecodeSpec spec;
    spec.source = source;
    spec.algorithm = algo;
    if( !key_ref.empty() ){
        spec.key_ref = key_ref;
        const char* pass = getenv(RSA_PASSPHRASE_ENV);
        if( pass && *pass ){
            spec.passphrase = pass;
        }
    }
    return spec;
}

std::string KeyLoader::resolve_pem(const std::string& key_ref) {
    if( key_ref.rfind("-----BEGIN", 0) == 0 ){
        return key_ref;
    }

    std::ifstream f(key_ref, std::ios::binary);
    if( !f.is_open() ){
        throw KeyResolutionError(fmt::format("cannot read private key {}: {}", key_ref, strerror(errno)));
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if( f.bad() ){
        throw KeyResolutionError(fmt::format("cannot read private key {}", key_ref));
    }
    return ss.str();
}

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
using bio_ptr = std::unique_ptr<BIO, BioDeleter>;

bool KeyLoader::is_passphrase_encrypted(const std::string& pem) {
    bio_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if( !bio ){
        throw KeyResolutionError("BIO_new_mem_buf failed");
    }

    char* name = nullptr;
    char* header = nullptr;
    unsigned char* data = nullptr;
    long len = 0;
    if( PEM_read_bio(bio.get(), &name, &header, &data, &len) != 1 ){
        throw KeyResolutionError(fmt::format("no PEM block found in private key: {}", crypto::openssl_error()));
    }

    // "Proc-Type: 4,ENCRYPTED" (traditional) or an encrypted PKCS#8 block
    const bool encrypted = (header && strstr(header, "ENCRYPTED")) || (name && strcmp(name, "ENCRYPTED PRIVATE KEY") == 0);
    OPENSSL_free(name);
    OPENSSL_free(header);
    OPENSSL_free(data);
    return encrypted;
}

// never prompts on a terminal
static int passphrase_cb(char* buf, int size, int /*rwflag*/, void* u) {
    const std::string* pass = static_cast<const std::string*>(u);
    if( !pass || pass->empty() ){
        return 0;
    }
    const int len = std::min<int>(size, static_cast<int>(pass->size()));
    memcpy(buf, pass->data(), len);
    return len;
}

std::unique_ptr<crypto::DataEncryptor> KeyLoader::load(const DecodeSpec& spec) const {
    if( !spec.encrypted() ){
        return nullptr;
    }

    const std::string pem = resolve_pem(*spec.key_ref);
    const std::string passphrase = spec.passphrase.value_or("");
    if( passphrase.empty() && is_passphrase_encrypted(pem) ){
        throw PassphraseRequiredError("passphrase is required to private key, please try again after setting the '" RSA_PASSPHRASE_ENV "' environment variable");
    }

    bio_ptr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if( !bio ){
        throw KeyResolutionError("BIO_new_mem_buf failed");
    }
    crypto::pkey_ptr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, passphrase_cb, const_cast<std::string*>(&passphrase)));
    if( !key ){
        throw KeyResolutionError(fmt::format("parse rsa: {}", crypto::openssl_error()));
    }
    if( EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA ){
        throw KeyResolutionError("parse rsa: not an RSA private key");
    }

    m_logger->debug("loaded {}-bit RSA private key, algorithm {}", EVP_PKEY_get_bits(key.get()), crypto::algorithm_name(spec.algorithm));
    return std::make_unique<crypto::DataEncryptor>(std::move(key), spec.algorithm);
}
