/**
 * @file ObjectStorage.cpp
 * @brief File-backed object storage and the decrypting wrapper around it.
 */

#include "ObjectStorage.hpp"
#include "io/FileStream.hpp"
#include "utils/common.hpp"

#include <algorithm>

std::unique_ptr<ReadStream> FileStorage::get(const std::string& key, int64_t off, int64_t limit) {
    if( off < 0 ){
        throw std::invalid_argument(fmt::format("get {}: negative offset {}", key, off));
    }
    auto stream = std::make_unique<FileStream>(m_root / key);
    if( off ){
        stream->seek(off);
    }
    stream->set_limit(limit);
    return stream;
}

std::unique_ptr<ReadStream> EncryptedStorage::get(const std::string& key, int64_t off, int64_t limit) {
    if( off < 0 ){
        throw std::invalid_argument(fmt::format("get {}: negative offset {}", key, off));
    }

    buf_t ciphertext;
    {
        auto stream = m_inner->get(key, 0, -1);
        ciphertext = stream->read_all();
        stream->close();
    }

    buf_t plain = m_encryptor.decrypt(ciphertext);
    const size_t start = std::min<size_t>(off, plain.size());
    const size_t end = limit < 0 ? plain.size() : std::min<size_t>(start + limit, plain.size());
    if( start != 0 || end != plain.size() ){
        plain = buf_t(plain.data() + start, end - start);
    }
    return std::make_unique<MemoryStream>(std::move(plain));
}

ObjectStorage::ptr create_storage(const std::string& scheme, const std::string& bucket) {
    if( scheme == "file" ){
        return std::make_shared<FileStorage>(bucket.empty() ? fs::path(".") : fs::path(bucket));
    }
    throw std::invalid_argument("unsupported object storage: " + scheme);
}
