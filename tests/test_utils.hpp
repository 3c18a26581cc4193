#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <variant>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "core/buf_t.hpp"
#include "utils/common.hpp"

using testing::HasSubstr;

std::string capture_stdout(const std::function<void()>& func);
std::vector<std::string> split(const std::string& str, const char delimiter);
std::string trim(const std::string& str);
void for_each_line(const std::string& str, const std::function<void(const std::string& line)>& func);

void write_file(const std::filesystem::path& fname, const std::string& data);
void write_file(const std::filesystem::path& fname, const buf_t& data);
std::string read_file(const std::filesystem::path& fname);

// fixtures are generated, not stored
buf_t gzip_compress(const std::string& data);
buf_t zstd_compress(const std::string& data);
std::string generate_rsa_pem(int bits = 2048, const char* passphrase = nullptr);

typedef std::variant<std::string, std::filesystem::path, const char*> VPathOrStr;
std::vector<std::string> vpath2vstr(const std::initializer_list<VPathOrStr>& vpaths);

// sets an environment variable for the lifetime of the object
class ScopedEnv {
    public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();

    private:
    std::string m_name;
    std::optional<std::string> m_prev;
};

// fresh empty directory per test, removed afterwards
class TempDirTest : public ::testing::Test {
    protected:
    void SetUp() override;
    void TearDown() override;

    std::filesystem::path tmp(const std::string& name) const { return m_dir / name; }

    std::filesystem::path m_dir;
};

template <typename TCmd>
class CmdTestBase : public TempDirTest {
    protected:

    void run_cmd(const std::initializer_list<VPathOrStr>& args, int expected_code = 0) {
        TCmd cmd;
        std::vector<std::string> vargs = vpath2vstr(args);
        auto logger = Logger::null();
        logger->set_arguments(vargs);
        cmd.set_logger(logger);
        cmd.parser().parse_args(vargs);
        EXPECT_EQ(expected_code, cmd.run());
    }
};
