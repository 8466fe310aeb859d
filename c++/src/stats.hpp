#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "timer.hpp"

// Process-wide counters shared by every worker thread.
class Stats {
  public:
    void request_received() { ++m_requests; }
    void download_started() { ++m_downloads; }
    void bytes_streamed(std::size_t n) { m_bytes_streamed += n; }
    void add_not_found() { ++m_not_found; }
    void add_unsatisfiable() { ++m_unsatisfiable; }
    void add_upstream_error() { ++m_upstream_errors; }
    void add_client_disconnect() { ++m_client_disconnects; }
    void add_truncated_stream() { ++m_truncated_streams; }

    std::uint64_t requests() const { return m_requests; }
    std::uint64_t downloads() const { return m_downloads; }
    std::uint64_t bytes_streamed() const { return m_bytes_streamed; }
    std::uint64_t not_found() const { return m_not_found; }
    std::uint64_t unsatisfiable() const { return m_unsatisfiable; }
    std::uint64_t upstream_errors() const { return m_upstream_errors; }
    std::uint64_t client_disconnects() const { return m_client_disconnects; }
    std::uint64_t truncated_streams() const { return m_truncated_streams; }

    /**
     * Logs the counters with the throughput since the previous report.
     *
     * @param force Log even when nothing happened since the last report
     * @return Whether a line was logged
     */
    bool report(bool force = false);

  private:
    std::atomic<std::uint64_t> m_requests{0};
    std::atomic<std::uint64_t> m_downloads{0};
    std::atomic<std::uint64_t> m_bytes_streamed{0};
    std::atomic<std::uint64_t> m_not_found{0};
    std::atomic<std::uint64_t> m_unsatisfiable{0};
    std::atomic<std::uint64_t> m_upstream_errors{0};
    std::atomic<std::uint64_t> m_client_disconnects{0};
    std::atomic<std::uint64_t> m_truncated_streams{0};

    // Only touched by the thread calling report()
    Timer m_since_report;
    std::uint64_t m_last_reported_requests{0};
    std::uint64_t m_last_reported_bytes{0};
};
