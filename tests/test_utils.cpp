#include "test_utils.hpp"
#include <gtest/gtest.h>

#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <zlib.h>
#include <zstd.h>

std::string capture_stdout(const std::function<void()>& func) {
    testing::internal::CaptureStdout();
    func();
    return testing::internal::GetCapturedStdout();
}

std::vector<std::string> split(const std::string& str, const char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);

    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string trim(const std::string& str) {
    std::string token = str;
    // Trim leading and trailing whitespace
    token.erase(0, token.find_first_not_of(" \t\n\r"));
    token.erase(token.find_last_not_of(" \t\n\r") + 1);
    return token;
}

void for_each_line(const std::string& str, const std::function<void(const std::string& line)>& func) {
    for (const auto& line : split(str, '\n')) {
        func(trim(line));
    }
}

std::vector<std::string> vpath2vstr(const std::initializer_list<VPathOrStr>& vpaths) {
    std::vector<std::string> result;
    result.reserve(vpaths.size());
    for (const auto& vpath : vpaths) {
        if (std::holds_alternative<std::string>(vpath)) {
            result.push_back(std::get<std::string>(vpath));
        } else if (std::holds_alternative<std::filesystem::path>(vpath)) {
            result.push_back(std::get<std::filesystem::path>(vpath).string());
        } else {
            result.push_back(std::get<const char*>(vpath));
        }
    }
    return result;
}

void write_file(const std::filesystem::path& fname, const std::string& data) {
    std::ofstream f(fname, std::ios::binary | std::ios::trunc);
    f.write(data.data(), data.size());
    if (!f) {
        throw std::runtime_error("cannot write " + fname.string());
    }
}

void write_file(const std::filesystem::path& fname, const buf_t& data) {
    write_file(fname, std::string(data.begin(), data.end()));
}

std::string read_file(const std::filesystem::path& fname) {
    std::ifstream f(fname, std::ios::binary);
    if (!f) {
        throw std::runtime_error("cannot read " + fname.string());
    }
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

buf_t gzip_compress(const std::string& data) {
    z_stream strm = {};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    buf_t out(deflateBound(&strm, data.size()) + 64);
    strm.next_in = (Bytef*)data.data();
    strm.avail_in = data.size();
    strm.next_out = out.data();
    strm.avail_out = out.size();
    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(strm.total_out);
    return out;
}

buf_t zstd_compress(const std::string& data) {
    buf_t out(ZSTD_compressBound(data.size()));
    size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
    if (ZSTD_isError(n)) {
        throw std::runtime_error(ZSTD_getErrorName(n));
    }
    out.resize(n);
    return out;
}

// traditional PEM, so an encrypted key gets a "Proc-Type: 4,ENCRYPTED" header
std::string generate_rsa_pem(int bits, const char* passphrase) {
    EVP_PKEY* pkey = EVP_RSA_gen(bits);
    if (!pkey) {
        throw std::runtime_error("EVP_RSA_gen failed");
    }
    BIO* bio = BIO_new(BIO_s_mem());
    const EVP_CIPHER* cipher = passphrase ? EVP_aes_256_cbc() : nullptr;
    int ok = PEM_write_bio_PrivateKey_traditional(bio, pkey, cipher,
            (unsigned char*)passphrase, passphrase ? strlen(passphrase) : 0, nullptr, nullptr);
    EVP_PKEY_free(pkey);
    if (!ok) {
        BIO_free(bio);
        throw std::runtime_error("PEM_write_bio_PrivateKey_traditional failed");
    }
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    std::string pem(data, len);
    BIO_free(bio);
    return pem;
}

ScopedEnv::ScopedEnv(const char* name, const char* value) : m_name(name) {
    if (const char* prev = getenv(name)) {
        m_prev = prev;
    }
    if (value) {
        setenv(name, value, 1);
    } else {
        unsetenv(name);
    }
}

ScopedEnv::~ScopedEnv() {
    if (m_prev) {
        setenv(m_name.c_str(), m_prev->c_str(), 1);
    } else {
        unsetenv(m_name.c_str());
    }
}

void TempDirTest::SetUp() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    m_dir = std::filesystem::temp_directory_path() /
        fmt::format("metaload_{}_{}_{}", info->test_suite_name(), info->name(), getpid());
    std::filesystem::remove_all(m_dir);
    std::filesystem::create_directories(m_dir);
}

void TempDirTest::TearDown() {
    std::error_code ec;
    // restore permissions changed by a test, or remove_all can fail
    for (const auto& entry : std::filesystem::recursive_directory_iterator(m_dir, ec)) {
        std::filesystem::permissions(entry.path(), std::filesystem::perms::owner_all, std::filesystem::perm_options::add, ec);
    }
    std::filesystem::remove_all(m_dir, ec);
}
