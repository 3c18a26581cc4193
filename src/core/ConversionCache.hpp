#pragma once
#include <filesystem>
#include <memory>

#include "core/StreamComposer.hpp"
#include "io/Logger.hpp"
#include "utils/crypto.hpp"

// Decodes an encrypted and/or compressed backup into a plain sibling file, once.
// An existing sibling is reused as is: no hash or timestamp check.
class ConversionCache {
    public:
    explicit ConversionCache(std::shared_ptr<Logger> logger) : m_logger(logger), m_composer(logger) {}

    // returns the source itself when there's nothing to decode
    std::filesystem::path materialize(const std::filesystem::path& source, const crypto::DataEncryptor* encryptor) const;

    // "backup.json.gz" -> "backup.json", "dump" -> "dump.plain"
    static std::filesystem::path plain_path(const std::filesystem::path& source);

    static bool needs_decode(const std::filesystem::path& source, bool encrypted);

    private:
    std::shared_ptr<Logger> m_logger;
    StreamComposer m_composer;
};
