/**
 * @file ConversionCache.cpp
 * @brief Materialization of decoded backups next to their source.
 *
 * The target is created with O_EXCL, so of two concurrent conversions of the
 * same backup only one can create it. A failed copy leaves the partial target
 * on disk; a later run will take it for a finished conversion.
 */

#include "ConversionCache.hpp"
#include "core/errors.hpp"
#include "io/DecompressStream.hpp"
#include "io/Writer.hpp"
#include "utils/common.hpp"

bool ConversionCache::needs_decode(const fs::path& source, bool encrypted) {
    return encrypted || compression_from_path(source) != Compression::None;
}

fs::path ConversionCache::plain_path(const fs::path& source) {
    fs::path fname = source.filename();
    if( !fname.has_extension() ){
        return fs::path(source) += ".plain";
    }
    return source.parent_path() / fname.replace_extension();
}

fs::path ConversionCache::materialize(const fs::path& source, const crypto::DataEncryptor* encryptor) const {
    if( !needs_decode(source, encryptor != nullptr) ){
        return source;
    }

    const fs::path target = plain_path(source);
    std::error_code ec;
    if( fs::exists(target, ec) ){
        m_logger->info("plain backup {} already exists, skip conversion", target);
        return target;
    }

    std::unique_ptr<ComposedStream> src = m_composer.open(source.string(), encryptor);

    std::unique_ptr<Writer> dst;
    try {
        dst = std::make_unique<Writer>(target, Writer::Mode::Exclusive);
    } catch (const std::runtime_error& e) {
        src->close();
        throw CreateTargetError(fmt::format("failed to create plain backup {}: {}", target, e.what()));
    }

    uint64_t total = 0;
    try {
        buf_t buf(1 << 20);
        while( size_t nread = src->read(buf.data(), buf.size()) ){
            dst->write(buf.data(), nread);
            total += nread;
        }
        dst->close();
        src->close();
    } catch (const std::runtime_error& e) {
        // dst and src are released by their destructors, the partial target stays
        throw CopyError(fmt::format("failed to convert {} to {}: {}", source, target, e.what()));
    }

    m_logger->info("converted backup {} to {} ({})", source, target, bytes2human(total));
    return target;
}
