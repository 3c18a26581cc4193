#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "io/ReadStream.hpp"
#include "utils/crypto.hpp"

// Minimal object-store view used to fetch backups: named objects, read by byte range.
class ObjectStorage {
    public:
    using ptr = std::shared_ptr<ObjectStorage>;

    virtual ~ObjectStorage() {}

    // bytes [off, off+limit) of the object, limit -1 = to the end
    virtual std::unique_ptr<ReadStream> get(const std::string& key, int64_t off = 0, int64_t limit = -1) = 0;

    virtual std::string describe() const = 0;
};

// objects are files below a root directory
class FileStorage : public ObjectStorage {
    public:
    explicit FileStorage(const std::filesystem::path& root) : m_root(root) {}

    std::unique_ptr<ReadStream> get(const std::string& key, int64_t off = 0, int64_t limit = -1) override;
    std::string describe() const override { return "file://" + m_root.string(); }

    private:
    std::filesystem::path m_root;
};

// decrypts whole objects of the wrapped storage, then serves ranges of the plaintext
class EncryptedStorage : public ObjectStorage {
    public:
    EncryptedStorage(ObjectStorage::ptr inner, const crypto::DataEncryptor& encryptor) : m_inner(std::move(inner)), m_encryptor(encryptor) {}

    // throws crypto::Error if the object can't be decrypted
    std::unique_ptr<ReadStream> get(const std::string& key, int64_t off = 0, int64_t limit = -1) override;
    std::string describe() const override { return m_inner->describe() + " (encrypted)"; }

    private:
    ObjectStorage::ptr m_inner;
    const crypto::DataEncryptor& m_encryptor;
};

// the storage an object store client would create for a "scheme://bucket" pair; only "file" is known
ObjectStorage::ptr create_storage(const std::string& scheme, const std::string& bucket);
