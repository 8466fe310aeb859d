#include <algorithm>
#include <utility>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "backend_pool.hpp"
#include "errors.hpp"
#include "log.hpp"

namespace beast = boost::beast;
namespace io = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = io::ip::tcp;

BackendConnection::BackendConnection(io::io_context &ioc, ssl::context &ctx,
                                     bool use_tls)
    : m_stream(ioc, ctx), m_use_tls(use_tls)
{}

void BackendConnection::connect(const tcp::resolver::results_type &endpoints,
                                const std::string &host,
                                io::yield_context yield, beast::error_code &ec)
{
    get_lowest_layer(m_stream).async_connect(endpoints, yield[ec]);
    if (ec)
        return;
    if (!m_use_tls)
        return;

    if (!SSL_set_tlsext_host_name(m_stream.native_handle(), host.c_str()))
    {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()),
                               io::error::get_ssl_category());
        return;
    }
    m_stream.async_handshake(ssl::stream_base::client, yield[ec]);
}

void BackendConnection::close(io::yield_context yield, beast::error_code &ec)
{
    if (m_use_tls)
    {
        m_stream.async_shutdown(yield[ec]);
        if (ec == ssl::error::stream_truncated || ec == io::error::eof)
        {
            ec = {};
        }
    }
    beast::error_code ignored;
    get_lowest_layer(m_stream).socket().shutdown(tcp::socket::shutdown_both,
                                                 ignored);
    get_lowest_layer(m_stream).close();
}

void BackendConnection::cancel() { get_lowest_layer(m_stream).cancel(); }

bool BackendConnection::is_open() const
{
    return get_lowest_layer(m_stream).socket().is_open();
}

BackendPool::Lease::Lease(Lease &&other) noexcept
    : m_pool(std::exchange(other.m_pool, nullptr)),
      m_connection(std::move(other.m_connection)),
      m_discard(std::exchange(other.m_discard, false))
{}

BackendPool::Lease &BackendPool::Lease::operator=(Lease &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_pool = std::exchange(other.m_pool, nullptr);
        m_connection = std::move(other.m_connection);
        m_discard = std::exchange(other.m_discard, false);
    }
    return *this;
}

void BackendPool::Lease::release()
{
    if (m_pool && m_connection)
    {
        m_pool->release(std::move(m_connection), m_discard);
    }
    m_pool = nullptr;
    m_discard = false;
}

BackendPool::BackendPool(io::io_context &ioc, ssl::context &ctx,
                         BackendConfig config)
    : m_ioc(ioc), m_ssl_context(ctx), m_config(std::move(config))
{}

BackendPool::Lease BackendPool::acquire(Cancellation &cancellation,
                                        io::yield_context yield,
                                        beast::error_code &ec)
{
    ec = {};
    while (true)
    {
        if (cancellation.cancelled())
        {
            ec = StreamError::client_disconnected;
            return {};
        }

        auto now = std::chrono::steady_clock::now();
        while (!m_idle.empty())
        {
            auto connection = std::move(m_idle.back());
            m_idle.pop_back();
            if (connection->is_open() &&
                now - connection->last_used() < m_config.idle_ttl)
            {
                return Lease{*this, std::move(connection)};
            }
            --m_open;
        }

        if (m_open < m_config.max_connections)
        {
            ++m_open;
            auto connection = std::make_unique<BackendConnection>(
                m_ioc, m_ssl_context, m_config.use_tls);
            connect(*connection, cancellation, yield, ec);
            if (ec)
            {
                --m_open;
                wake_one();
                return {};
            }
            return Lease{*this, std::move(connection)};
        }

        // Every connection is leased: wait for release() or cancellation.
        io::steady_timer waiter{m_ioc, io::steady_timer::time_point::max()};
        m_waiters.push_back(&waiter);
        {
            Cancellation::Slot slot(cancellation, [&waiter] { waiter.cancel(); });
            beast::error_code wait_ec;
            waiter.async_wait(yield[wait_ec]);
        }
        std::erase(m_waiters, &waiter);
        if (cancellation.cancelled() &&
            (!m_idle.empty() || m_open < m_config.max_connections))
        {
            // Hand a wake-up this waiter may have consumed to the next one.
            wake_one();
        }
    }
}

void BackendPool::close_idle(io::yield_context yield)
{
    auto idle = std::move(m_idle);
    m_idle.clear();
    for (auto &connection : idle)
    {
        beast::error_code ec;
        connection->close(yield, ec);
        if (ec)
        {
            log_debug("closing backend connection: {}", ec.message());
        }
        --m_open;
    }
}

void BackendPool::release(std::unique_ptr<BackendConnection> connection,
                          bool discard)
{
    if (discard || !connection->is_open())
    {
        --m_open;
    }
    else
    {
        connection->touch();
        m_idle.push_back(std::move(connection));
    }
    wake_one();
}

void BackendPool::wake_one()
{
    if (m_waiters.empty())
    {
        return;
    }
    auto *waiter = m_waiters.front();
    m_waiters.pop_front();
    waiter->cancel();
}

void BackendPool::connect(BackendConnection &connection,
                          Cancellation &cancellation, io::yield_context yield,
                          beast::error_code &ec)
{
    auto fail = [&](const char *what)
    {
        if (cancellation.cancelled())
        {
            ec = StreamError::client_disconnected;
            return;
        }
        log_warning("backend {}: {}", what, ec.message());
        ec = StreamError::upstream_transport_error;
    };

    if (!m_endpoints)
    {
        tcp::resolver resolver{m_ioc};
        Cancellation::Slot slot(cancellation, [&resolver] { resolver.cancel(); });
        auto endpoints =
            resolver.async_resolve(m_config.host, m_config.port, yield[ec]);
        if (ec)
        {
            return fail("resolve");
        }
        m_endpoints = std::move(endpoints);
    }

    Cancellation::Slot slot(cancellation,
                            [&connection] { connection.cancel(); });
    connection.connect(*m_endpoints, m_config.host, yield, ec);
    if (ec)
    {
        m_endpoints.reset();
        return fail("connect");
    }
    log_debug("backend connection established to {}:{}", m_config.host,
              m_config.port);
}
