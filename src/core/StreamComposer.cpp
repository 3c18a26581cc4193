#include "StreamComposer.hpp"
#include "core/errors.hpp"
#include "io/FileStream.hpp"
#include "storage/ObjectStorage.hpp"
#include "utils/common.hpp"

#include <sys/stat.h>

// Encrypted backups go through the same object storage path as encrypted remote objects:
// a storage rooted at the file's directory, wrapped by the decrypting storage.
std::unique_ptr<ReadStream> StreamComposer::open_encrypted(const std::string& source, const crypto::DataEncryptor& encryptor) const {
    struct stat st;
    if( stat(source.c_str(), &st) == -1 ){
        throw SourceNotFoundError(fmt::format("failed to stat {}: {}", source, strerror(errno)));
    }

    std::error_code ec;
    fs::path abs = fs::absolute(source, ec);
    if( ec ){
        throw SourceNotFoundError(fmt::format("failed to get absolute path of {}: {}", source, ec.message()));
    }

    ObjectStorage::ptr inner = create_storage("file", abs.parent_path().string());
    EncryptedStorage storage(inner, encryptor);
    m_logger->debug("decrypting {} from {} with {}", abs.filename(), storage.describe(), crypto::algorithm_name(encryptor.algorithm()));

    try {
        return storage.get(abs.filename().string(), 0, -1);
    } catch (const crypto::Error& e) {
        throw DecodeInitError(fmt::format("failed to decrypt {}: {}", source, e.what()));
    } catch (const ReadStream::ReadError& e) {
        throw DecodeInitError(fmt::format("failed to read {}: {}", source, e.what()));
    } catch (const std::runtime_error& e) {
        // FileStream open failure
        throw SourceNotFoundError(fmt::format("failed to open {}: {}", source, e.what()));
    }
}

std::unique_ptr<ComposedStream> StreamComposer::open(const std::string& source, const crypto::DataEncryptor* encryptor) const {
    std::unique_ptr<ReadStream> base;
    if( encryptor ){
        base = open_encrypted(source, *encryptor);
    } else {
        try {
            base = std::make_unique<FileStream>(source);
        } catch (const std::runtime_error& e) {
            throw SourceNotFoundError(fmt::format("failed to open {}: {}", source, e.what()));
        }
    }

    const Compression compression = compression_from_path(source);
    m_logger->debug("opening {}: compression {}, encryption {}", source, compression_name(compression),
            encryptor ? crypto::algorithm_name(encryptor->algorithm()) : "none");

    // decoder constructors check the stream header and throw DecodeInitError
    std::unique_ptr<ReadStream> decoder = make_decoder(compression, *base, source);
    return std::make_unique<ComposedStream>(std::move(base), std::move(decoder));
}
