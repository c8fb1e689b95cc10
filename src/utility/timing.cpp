#include "timing.hpp"

#include <algorithm>
#include <exception>

#include <fmt/format.h>

namespace kernelbench {

using namespace std::chrono;

void TimingLog::record(TimingRecord rec) {
    m_records.push_back(std::move(rec));
    if (m_capacity != 0 && m_records.size() > m_capacity) {
        m_records.erase(m_records.begin(),
                        m_records.end() - static_cast<long>(m_capacity));
    }
}

void TimingLog::set_capacity(std::size_t capacity) {
    m_capacity = capacity;
    if (m_capacity != 0 && m_records.size() > m_capacity) {
        m_records.erase(m_records.begin(),
                        m_records.end() - static_cast<long>(m_capacity));
    }
}

std::optional<TimingRecord> TimingLog::last() const {
    if (m_records.empty()) {
        return std::nullopt;
    }
    return m_records.back();
}

std::optional<nanoseconds> TimingLog::best(std::string_view label) const {
    std::optional<nanoseconds> result;
    for (const auto &rec : m_records) {
        if (rec.label != label) {
            continue;
        }
        result = result ? std::min(*result, rec.elapsed) : rec.elapsed;
    }
    return result;
}

std::optional<nanoseconds> TimingLog::mean(std::string_view label) const {
    long long total = 0;
    long long count = 0;
    for (const auto &rec : m_records) {
        if (rec.label == label) {
            total += rec.elapsed.count();
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return nanoseconds(total / count);
}

ScopedTimer::ScopedTimer(std::string label, TimingLog *log)
    : m_label(std::move(label)), m_log(log), m_start(steady_clock::now()) {}

ScopedTimer::~ScopedTimer() noexcept {
    const nanoseconds took = elapsed();
    try {
        const Logger::Level level =
            m_log ? m_log->report_level() : Logger::INFO_LEVEL;
        Logger::log(level, __FILE__, __LINE__,
                    fmt::format("{} took {:.6f} seconds", m_label,
                                duration<double>(took).count()));
        if (m_log) {
            m_log->record(TimingRecord{m_label, took});
        }
    } catch (const std::exception &) {
        // the measurement is lost, the timed call's outcome is not
    }
}

nanoseconds ScopedTimer::elapsed() const noexcept {
    return duration_cast<nanoseconds>(steady_clock::now() - m_start);
}

} // namespace kernelbench
