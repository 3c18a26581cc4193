#include "test_utils.hpp"
#include "core/KeyLoader.hpp"
#include "core/StreamComposer.hpp"
#include "core/errors.hpp"

class StreamComposerTest : public TempDirTest {
    protected:
    std::string read_through(const std::filesystem::path& fname, const crypto::DataEncryptor* enc = nullptr) {
        auto s = StreamComposer(Logger::null()).open(fname.string(), enc);
        buf_t data = s->read_all();
        s->close();
        return std::string(data.begin(), data.end());
    }

    const std::string m_json = "{\"Setting\":{\"Name\":\"myjfs\",\"UUID\":\"1b2c\"},\"Counters\":{\"nextInode\":2}}";
};

TEST_F(StreamComposerTest, plain) {
    write_file(tmp("dump.json"), m_json);
    auto s = StreamComposer(Logger::null()).open(tmp("dump.json").string(), nullptr);
    EXPECT_TRUE(s->layers_aliased());
    s->close();
    EXPECT_EQ(m_json, read_through(tmp("dump.json")));
}

TEST_F(StreamComposerTest, gzip) {
    write_file(tmp("dump.json.gz"), gzip_compress(m_json));
    auto s = StreamComposer(Logger::null()).open(tmp("dump.json.gz").string(), nullptr);
    EXPECT_FALSE(s->layers_aliased());
    s->close();
    EXPECT_EQ(m_json, read_through(tmp("dump.json.gz")));
}

TEST_F(StreamComposerTest, zstd) {
    write_file(tmp("dump.json.zstd"), zstd_compress(m_json));
    EXPECT_EQ(m_json, read_through(tmp("dump.json.zstd")));
}

TEST_F(StreamComposerTest, unknown_suffix_is_not_decompressed) {
    buf_t zst = zstd_compress(m_json);
    write_file(tmp("dump.json.zst"), zst);
    EXPECT_EQ(std::string(zst.begin(), zst.end()), read_through(tmp("dump.json.zst")));
}

TEST_F(StreamComposerTest, bad_gzip_header) {
    write_file(tmp("dump.json.gz"), m_json);
    EXPECT_THROW(StreamComposer(Logger::null()).open(tmp("dump.json.gz").string(), nullptr), DecodeInitError);
}

TEST_F(StreamComposerTest, missing_source) {
    EXPECT_THROW(StreamComposer(Logger::null()).open(tmp("missing.json").string(), nullptr), SourceNotFoundError);
}

TEST_F(StreamComposerTest, encrypted_compressed) {
    DecodeSpec spec;
    spec.key_ref = generate_rsa_pem();
    spec.algorithm = crypto::Algorithm::CHACHA20_RSA;
    auto enc = KeyLoader(Logger::null()).load(spec);

    write_file(tmp("dump.json.gz"), enc->encrypt(gzip_compress(m_json)));
    EXPECT_EQ(m_json, read_through(tmp("dump.json.gz"), enc.get()));
}

TEST_F(StreamComposerTest, encrypted_missing_source) {
    DecodeSpec spec;
    spec.key_ref = generate_rsa_pem();
    auto enc = KeyLoader(Logger::null()).load(spec);
    EXPECT_THROW(StreamComposer(Logger::null()).open(tmp("missing.json").string(), enc.get()), SourceNotFoundError);
}

TEST_F(StreamComposerTest, encrypted_with_wrong_key) {
    DecodeSpec spec;
    spec.key_ref = generate_rsa_pem();
    auto enc = KeyLoader(Logger::null()).load(spec);
    spec.key_ref = generate_rsa_pem();
    auto other = KeyLoader(Logger::null()).load(spec);

    write_file(tmp("dump.json"), enc->encrypt(buf_t(m_json.data(), m_json.size())));
    EXPECT_THROW(StreamComposer(Logger::null()).open(tmp("dump.json").string(), other.get()), DecodeInitError);
}
