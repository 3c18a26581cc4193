#pragma once
#include <time.h>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// A line of named count spinners, e.g. "[⠙] format: 1, inode: 1200, edge: 1198, elapsed: 3s".
// Counters may be incremented concurrently from worker threads; registering new counters may not.
class Progress {
    public:
    class Counter {
        public:
        void incr_by(uint64_t n);
        uint64_t value() const { return m_value.load(std::memory_order_relaxed); }
        const std::string& name() const { return m_name; }

        private:
        friend class Progress;
        Counter(Progress& owner, const std::string& name) : m_owner(owner), m_name(name) {}

        Progress& m_owner;
        const std::string m_name;
        std::atomic<uint64_t> m_value {0};
    };

    explicit Progress(bool quiet = false, FILE* out = stdout) : m_quiet(quiet), m_out(out) {
        clock_gettime(CLOCK_MONOTONIC, &m_start_time);
        m_prev_time = m_start_time;
    }

    Counter& add_count_spinner(const std::string& name);
    Counter* find(const std::string& name) const;

    // redraws at most ~10 times per second unless final
    void update(bool final = false);
    void done() { update(true); }

    std::string to_string() const;

    private:
    const bool m_quiet;
    FILE* m_out;
    timespec m_start_time, m_prev_time;
    std::vector<std::unique_ptr<Counter>> m_counters; // in registration order
    std::mutex m_mutex;
    size_t m_spinner_idx = 0;
    bool m_finished = false;
};
