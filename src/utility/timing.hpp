#pragma once

#include <chrono>
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "logger.hpp"

namespace kernelbench {

/**
 * @brief One measured call: what ran and how long it took
 */
struct TimingRecord {
    std::string label;
    std::chrono::nanoseconds elapsed{0};

    double seconds() const noexcept {
        return std::chrono::duration<double>(elapsed).count();
    }
};

/**
 * @brief Append-only collection of timing records
 */
class TimingLog {
  public:
    void record(TimingRecord rec);
    void clear() noexcept { m_records.clear(); }

    const std::vector<TimingRecord> &records() const noexcept {
        return m_records;
    }

    std::optional<TimingRecord> last() const;

    /**
     * @brief Fastest recorded run for a label
     * @return Empty when the label was never recorded
     */
    std::optional<std::chrono::nanoseconds> best(std::string_view label) const;

    /**
     * @brief Mean duration of all recorded runs for a label
     * @return Empty when the label was never recorded
     */
    std::optional<std::chrono::nanoseconds> mean(std::string_view label) const;

    /**
     * @brief Level at which timers recording into this log report their
     * measurement
     */
    void set_report_level(Logger::Level level) noexcept {
        m_report_level = level;
    }
    Logger::Level report_level() const noexcept { return m_report_level; }

    /**
     * @brief Keeps only the newest records once more than capacity were
     * recorded (0 keeps everything)
     */
    void set_capacity(std::size_t capacity);

  private:
    std::vector<TimingRecord> m_records;
    Logger::Level m_report_level = Logger::INFO_LEVEL;
    std::size_t m_capacity = 0;
};

/**
 * @brief Measures the lifetime of a scope and reports it on destruction
 *
 * Reports a log line "<label> took <seconds> seconds" (at INFO, or at the
 * log's report level) and appends a record to the optional TimingLog.
 * Reporting also happens during stack unwinding, so a throwing call is still
 * measured. A failure while reporting drops the measurement and never escapes
 * the destructor.
 */
class ScopedTimer {
  public:
    explicit ScopedTimer(std::string label, TimingLog *log = nullptr);
    ~ScopedTimer() noexcept;
    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;
    ScopedTimer(ScopedTimer &&) = delete;
    ScopedTimer &operator=(ScopedTimer &&) = delete;

    std::chrono::nanoseconds elapsed() const noexcept;

  private:
    std::string m_label;
    TimingLog *m_log;
    std::chrono::steady_clock::time_point m_start;
};

/**
 * @brief Concept for calls the timing harness can wrap
 * @details Any callable invocable with no arguments, i.e. a kernel call with
 * its arguments already bound
 */
template <typename F>
concept Timeable = std::invocable<F>;

/**
 * @brief Calls fn, measures how long it took and returns its result unchanged
 * @param label Name reported with the measurement
 * @param fn Zero-argument callable
 * @param log Optional sink for the measurement
 * @return Whatever fn returns (value, reference or void)
 */
template <Timeable F>
decltype(auto) timefn(std::string_view label, F &&fn,
                      TimingLog *log = nullptr) {
    ScopedTimer timer{std::string(label), log};
    return std::invoke(std::forward<F>(fn));
}

} // namespace kernelbench
