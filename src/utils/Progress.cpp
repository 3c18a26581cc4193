/**
 * @file Progress.cpp
 * @brief Implementation of the count spinners shown while loading segments.
 *
 * Counters are atomic so that the load progress callback can be invoked from
 * several worker threads at once. Redrawing is throttled and serialized by a
 * mutex; a worker that finds the mutex busy simply skips the redraw.
 */

#include "Progress.hpp"
#include "common.hpp"

#include <array>
#include <string_view>

static constexpr std::array<std::string_view, 10> SPINNER = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
};

void Progress::Counter::incr_by(uint64_t n){
    m_value.fetch_add(n, std::memory_order_relaxed);
    m_owner.update();
}

Progress::Counter& Progress::add_count_spinner(const std::string& name){
    if( Counter* existing = find(name) ){
        return *existing;
    }
    m_counters.push_back(std::unique_ptr<Counter>(new Counter(*this, name)));
    return *m_counters.back();
}

Progress::Counter* Progress::find(const std::string& name) const {
    for( const auto& counter : m_counters ){
        if( counter->name() == name ){
            return counter.get();
        }
    }
    return nullptr;
}

std::string Progress::to_string() const {
    std::string result;
    for( const auto& counter : m_counters ){
        if( !result.empty() ) result += ", ";
        result += fmt::format("{}: {}", counter->name(), counter->value());
    }
    return result.empty() ? "-" : result;
}

/**
 * @brief Redraws the spinner line.
 *
 * @param final If true, always redraws and terminates the line with a newline.
 */
void Progress::update(bool final){
    if( m_quiet ){
        return;
    }

    std::unique_lock<std::mutex> lock(m_mutex, std::defer_lock);
    if( final ){
        lock.lock();
    } else if( !lock.try_lock() ){
        return; // another thread is drawing right now
    }
    if( m_finished ){
        return;
    }

    struct timespec cur_time;
    clock_gettime(CLOCK_MONOTONIC, &cur_time);

    uint64_t dt = (cur_time.tv_sec - m_prev_time.tv_sec) * 1000000000L + (cur_time.tv_nsec - m_prev_time.tv_nsec);
    if( dt < 100000000 && !final ){
        return;
    }
    m_prev_time = cur_time;

    const uint64_t elapsed = cur_time.tv_sec - m_start_time.tv_sec;

    fmt::print(m_out, "[{}] {}, elapsed: {}" ANSI_CLEAR_EOL "{}",
        final ? "✓" : SPINNER[m_spinner_idx++],
        to_string(),
        seconds2human(elapsed),
        final ? "\n" : "\r"
        );
    fflush(m_out);

    if( m_spinner_idx >= SPINNER.size() ){
        m_spinner_idx = 0;
    }
    m_finished = final;
}
