#pragma once
#include <memory>
#include <string>

#include "io/ComposedStream.hpp"
#include "io/DecompressStream.hpp"
#include "io/Logger.hpp"
#include "utils/crypto.hpp"

// Builds the decrypt+decompress pipeline over a backup file.
class StreamComposer {
    public:
    explicit StreamComposer(std::shared_ptr<Logger> logger) : m_logger(std::move(logger)) {}

    // encryptor may be nullptr; compression is taken from the file suffix
    std::unique_ptr<ComposedStream> open(const std::string& source, const crypto::DataEncryptor* encryptor) const;

    private:
    std::unique_ptr<ReadStream> open_encrypted(const std::string& source, const crypto::DataEncryptor& encryptor) const;

    std::shared_ptr<Logger> m_logger;
};
