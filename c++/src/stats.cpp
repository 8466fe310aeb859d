#include "log.hpp"
#include "stats.hpp"

bool Stats::report(bool force)
{
    auto seconds = m_since_report.lap_seconds();

    auto bytes = m_bytes_streamed.load();
    auto new_bytes = bytes - m_last_reported_bytes;
    auto mb_per_sec = seconds > 0 ? new_bytes / seconds / 1024 / 1024 : 0.0;
    m_last_reported_bytes = bytes;

    auto requests = m_requests.load();
    auto new_requests = requests - m_last_reported_requests;
    m_last_reported_requests = requests;

    if (new_requests == 0 && new_bytes == 0 && !force)
    {
        return false;
    }

    log_info("{:6.2f} MB/s, req:{} dl:{} 404:{} 416:{} E:{}/D:{}/T:{}, {} MB "
             "streamed",
             mb_per_sec, requests, m_downloads.load(), m_not_found.load(),
             m_unsatisfiable.load(), m_upstream_errors.load(),
             m_client_disconnects.load(), m_truncated_streams.load(),
             bytes / 1024 / 1024);
    return true;
}
