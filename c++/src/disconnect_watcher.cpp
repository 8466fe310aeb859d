#include "disconnect_watcher.hpp"
#include "log.hpp"

namespace beast = boost::beast;
namespace io = boost::asio;

// Past this much pipelined input the watcher stops reading.
constexpr std::size_t WATCH_BUFFER_LIMIT = 16 * 1024;
constexpr std::size_t WATCH_READ_SIZE = 512;

DisconnectWatcher::DisconnectWatcher(beast::tcp_stream &client,
                                     beast::flat_buffer &buffer,
                                     Cancellation &cancellation)
    : m_client(client), m_buffer(buffer), m_cancellation(cancellation),
      m_exited(client.get_executor(), io::steady_timer::time_point::max())
{}

void DisconnectWatcher::start(io::yield_context yield)
{
    m_running = true;
    io::spawn(yield, [this](io::yield_context watch_yield)
              { watch(watch_yield); });
}

void DisconnectWatcher::stop(io::yield_context yield)
{
    m_stopping = true;
    if (!m_running)
    {
        return;
    }
    beast::error_code ec;
    m_client.socket().cancel(ec);
    m_exited.async_wait(yield[ec]);
}

void DisconnectWatcher::watch(io::yield_context yield)
{
    beast::error_code ec;
    while (!m_stopping && m_buffer.size() < WATCH_BUFFER_LIMIT)
    {
        auto n = m_client.socket().async_read_some(
            m_buffer.prepare(WATCH_READ_SIZE), yield[ec]);
        if (ec)
        {
            if (!m_stopping)
            {
                log_debug("client connection lost: {}", ec.message());
                m_cancellation.cancel();
            }
            break;
        }
        m_buffer.commit(n);
    }
    m_running = false;
    m_exited.cancel();
}
