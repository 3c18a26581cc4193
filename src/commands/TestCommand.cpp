/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for system self-testing.
 *
 * Verifies that the on-disk structs have the sizes the container format
 * expects, that offsets are 64-bit and that the linked OpenSSL provides the
 * AEAD ciphers used for encrypted backups.
 */

#include "TestCommand.hpp"
#include "Meta/Bak/BakTrailer.hpp"
#include "Meta/Bak/SegmentHeader.hpp"
#include "utils/common.hpp"
#include "utils/crypto.hpp"

#include <openssl/evp.h>

using namespace Meta::Bak;

REGISTER_COMMAND(TestCommand);

TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Executes the self-tests.
 *
 * Checks:
 * - off_t, size_t, uint64_t: 8 bytes (for large backups)
 * - sizeof(SegmentHeader) == 16, sizeof(BakTrailer) == 24
 * - AES-256-GCM and ChaCha20-Poly1305 are available
 *
 * @return EXIT_SUCCESS (0) if all tests pass, EXIT_FAILURE (1) if any test fails.
 */
int TestCommand::run() {
    m_logger->trace("selftest: sizeof(int)           = {}", sizeof(int));
    m_logger->trace("selftest: sizeof(off_t)         = {}", sizeof(off_t));
    m_logger->trace("selftest: sizeof(size_t)        = {}", sizeof(size_t));
    m_logger->trace("selftest: sizeof(uint64_t)      = {}", sizeof(uint64_t));
    m_logger->trace("selftest: sizeof(SegmentHeader) = {}", sizeof(SegmentHeader));
    m_logger->trace("selftest: sizeof(BakTrailer)    = {}", sizeof(BakTrailer));

    if( sizeof(off_t) != 8 ){
        m_logger->critical("selftest: sizeof(off_t) != 8");
        return 1;
    }

    if( sizeof(size_t) != 8 ){
        m_logger->critical("selftest: sizeof(size_t) != 8");
        return 1;
    }

    if( sizeof(uint64_t) != 8 ){
        m_logger->critical("selftest: sizeof(uint64_t) != 8");
        return 1;
    }

    if( sizeof(SegmentHeader) != 16 ){
        m_logger->critical("selftest: sizeof(SegmentHeader) != 16");
        return 1;
    }

    if( sizeof(BakTrailer) != 24 ){
        m_logger->critical("selftest: sizeof(BakTrailer) != 24");
        return 1;
    }

    for( auto algo : { crypto::Algorithm::AES256GCM_RSA, crypto::Algorithm::CHACHA20_RSA } ){
        const char* cipher_name = algo == crypto::Algorithm::AES256GCM_RSA ? "aes-256-gcm" : "chacha20-poly1305";
        const EVP_CIPHER* cipher = EVP_get_cipherbyname(cipher_name);
        m_logger->trace("selftest: {} ({}) = {}", crypto::algorithm_name(algo), cipher_name, cipher ? "available" : "missing");
        if( !cipher ){
            m_logger->critical("selftest: {} is not available: {}", cipher_name, crypto::openssl_error());
            return 1;
        }
    }

    m_logger->trace("selftest: OK");
    return 0;
}
