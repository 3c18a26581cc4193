#pragma once
#include <memory>
#include <optional>
#include <string>

#include "io/Logger.hpp"
#include "utils/crypto.hpp"

// What to decode and how; built once per invocation from the command line and the environment.
struct DecodeSpec {
    std::string source;
    std::optional<std::string> key_ref;     // PEM text or path to a PEM file
    std::optional<std::string> passphrase;  // from RSA_PASSPHRASE_ENV only
    crypto::Algorithm algorithm = crypto::Algorithm::AES256GCM_RSA;

    bool encrypted() const { return key_ref.has_value() && !key_ref->empty(); }

    // empty key_ref means "not encrypted"
    static DecodeSpec from_env(const std::string& source, const std::string& key_ref, crypto::Algorithm algo);
};

// Resolves a private key reference into a decryption capability.
class KeyLoader {
    public:
    explicit KeyLoader(std::shared_ptr<Logger> logger) : m_logger(std::move(logger)) {}

    // nullptr if the spec has no key
    std::unique_ptr<crypto::DataEncryptor> load(const DecodeSpec& spec) const;

    // inline PEM is returned as is, anything else is a path to read
    static std::string resolve_pem(const std::string& key_ref);

    // looks at the first PEM block only; throws KeyResolutionError if there's none
    static bool is_passphrase_encrypted(const std::string& pem);

    private:
    std::shared_ptr<Logger> m_logger;
};
