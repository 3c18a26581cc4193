#include <gtest/gtest.h>
#include "io/Reader.hpp"
#include <cstring>
#include <fstream>

TEST(Reader, open_not_existing_file) {
    EXPECT_THROW(Reader reader("not_existing_file"), std::runtime_error);
}

TEST(Reader, normal_read) {
    char buf[0x1000];
    memset(buf, 0, 0x1000);

    std::ofstream file("test.bin", std::ios::binary);
    file.write(buf, 0x1000);
    file.close();

    Reader reader("test.bin");
    EXPECT_EQ(0x1000u, reader.size());
    char buf2[0x1000];
    EXPECT_EQ(0x1000u, reader.read_at(0, buf2, 0x1000));
    EXPECT_EQ(0, memcmp(buf, buf2, 0x1000));
    std::filesystem::remove("test.bin");
}

TEST(Reader, read_past_eof) {
    std::ofstream file("test_eof.bin", std::ios::binary);
    file.write("0123456789", 10);
    file.close();

    Reader reader("test_eof.bin");
    char buf[0x20];
    EXPECT_EQ(4u, reader.read_at(6, buf, sizeof(buf)));
    EXPECT_EQ(0, memcmp(buf, "6789", 4));
    EXPECT_EQ(0u, reader.read_at(10, buf, sizeof(buf)));
    EXPECT_THROW(reader.read_at(-1, buf, 1), std::invalid_argument);
    EXPECT_THROW(reader.read_exact(8, buf, 4), Reader::ReadError);
    std::filesystem::remove("test_eof.bin");
}

TEST(Reader, read_pod) {
    std::ofstream file("test_pod.bin", std::ios::binary);
    const uint32_t values[2] = { 0x11223344, 0xdeadbeef };
    file.write(reinterpret_cast<const char*>(values), sizeof(values));
    file.close();

    Reader reader("test_pod.bin");
    EXPECT_EQ(0xdeadbeefu, reader.read_pod<uint32_t>(4));
    EXPECT_THROW(reader.read_pod<uint64_t>(4), Reader::ReadError);
    std::filesystem::remove("test_pod.bin");
}

TEST(Reader, directory) {
    std::filesystem::create_directories("test_dir.bin");
    EXPECT_THROW(Reader reader("test_dir.bin"), std::runtime_error);
    std::filesystem::remove("test_dir.bin");
}
