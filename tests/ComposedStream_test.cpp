#include "test_utils.hpp"
#include "io/ComposedStream.hpp"
#include "io/DecompressStream.hpp"
#include "io/FileStream.hpp"

// counts close() calls, records them into a shared log
class CountingStream : public MemoryStream {
    public:
    CountingStream(buf_t data, std::string name, std::vector<std::string>& log) : MemoryStream(std::move(data)), m_name(std::move(name)), m_log(log) {}

    void close() override {
        m_log.push_back(m_name);
        MemoryStream::close();
    }

    private:
    std::string m_name;
    std::vector<std::string>& m_log;
};

TEST(ComposedStream, requires_base) {
    EXPECT_THROW(ComposedStream(nullptr, nullptr), std::invalid_argument);
}

TEST(ComposedStream, aliased_layers_closed_once) {
    std::vector<std::string> log;
    ComposedStream s(std::make_unique<CountingStream>(buf_t("plain", 5), "base", log), nullptr);
    EXPECT_TRUE(s.layers_aliased());
    EXPECT_EQ(&s.base_layer(), &s.compression_layer());

    buf_t data = s.read_all();
    EXPECT_EQ("plain", std::string(data.begin(), data.end()));

    s.close();
    EXPECT_THAT(log, testing::ElementsAre("base"));
}

TEST(ComposedStream, distinct_layers_closed_in_order) {
    std::vector<std::string> log;
    auto base = std::make_unique<CountingStream>(gzip_compress("hello"), "base", log);
    ReadStream& upstream = *base;

    class CountingGzip : public GzipStream {
        public:
        CountingGzip(ReadStream& up, std::vector<std::string>& log) : GzipStream(up, "mem.gz"), m_log(log) {}
        void close() override { m_log.push_back("gzip"); GzipStream::close(); }
        std::vector<std::string>& m_log;
    };

    ComposedStream s(std::move(base), std::make_unique<CountingGzip>(upstream, log));
    EXPECT_FALSE(s.layers_aliased());

    buf_t data = s.read_all();
    EXPECT_EQ("hello", std::string(data.begin(), data.end()));

    s.close();
    EXPECT_THAT(log, testing::ElementsAre("gzip", "base"));
}

TEST(ComposedStream, second_close_is_noop) {
    std::vector<std::string> log;
    ComposedStream s(std::make_unique<CountingStream>(buf_t("x", 1), "base", log), nullptr);
    s.close();
    s.close();
    EXPECT_EQ(1, log.size());
}
