#include "test_utils.hpp"
#include "utils/Progress.hpp"

#include <thread>

TEST(Progress, empty) {
    Progress progress(true);
    EXPECT_EQ("-", progress.to_string());
    EXPECT_EQ(nullptr, progress.find("inode"));
}

TEST(Progress, add_count_spinner_is_idempotent) {
    Progress progress(true);
    auto& a = progress.add_count_spinner("inode");
    auto& b = progress.add_count_spinner("inode");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(&a, progress.find("inode"));
}

TEST(Progress, concurrent_increments) {
    Progress progress(true);
    auto& inode = progress.add_count_spinner("inode");
    auto& edge = progress.add_count_spinner("edge");

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 10000; i++) {
                inode.incr_by(1);
                edge.incr_by(2);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(80000, inode.value());
    EXPECT_EQ(160000, edge.value());
    EXPECT_EQ("inode: 80000, edge: 160000", progress.to_string());
}

TEST(Progress, done_prints_final_line) {
    FILE* f = tmpfile();
    ASSERT_NE(nullptr, f);
    {
        Progress progress(false, f);
        progress.add_count_spinner("format").incr_by(1);
        progress.add_count_spinner("inode").incr_by(1200);
        progress.done();
    }
    fflush(f);
    rewind(f);
    char buf[512] = {};
    size_t n = fread(buf, 1, sizeof(buf) - 1, f);
    fclose(f);

    std::string out(buf, n);
    EXPECT_THAT(out, HasSubstr("format: 1, inode: 1200"));
    EXPECT_THAT(out, HasSubstr("elapsed"));
    EXPECT_EQ('\n', out.back());
}
