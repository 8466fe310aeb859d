#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include "cancellation.hpp"

struct BackendConfig
{
    std::string host;
    std::string port{"443"};
    std::string target_prefix{"/files"};
    bool use_tls{true};
    std::size_t max_connections{4};
    std::chrono::seconds idle_ttl{30};
};

/**
 * One keep-alive connection to the chunk backend. The TLS layer is always
 * constructed; with TLS disabled the requests go through its next layer.
 */
class BackendConnection {
  public:
    using stream_t = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    BackendConnection(boost::asio::io_context &ioc,
                      boost::asio::ssl::context &ctx, bool use_tls);

    void connect(const boost::asio::ip::tcp::resolver::results_type &endpoints,
                 const std::string &host, boost::asio::yield_context yield,
                 boost::beast::error_code &ec);

    // Graceful shutdown. A truncated TLS shutdown or EOF is not an error.
    void close(boost::asio::yield_context yield, boost::beast::error_code &ec);

    // Aborts whatever operation is pending. The connection must be discarded
    // afterwards.
    void cancel();

    bool is_open() const;

    template <typename Function> decltype(auto) visit(Function &&function)
    {
        if (m_use_tls)
        {
            return function(m_stream);
        }
        return function(m_stream.next_layer());
    }

    // Holds bytes read past the end of the previous response.
    boost::beast::flat_buffer &buffer() { return m_buffer; }

    void touch() { m_last_used = std::chrono::steady_clock::now(); }
    std::chrono::steady_clock::time_point last_used() const
    {
        return m_last_used;
    }

  private:
    stream_t m_stream;
    boost::beast::flat_buffer m_buffer;
    bool m_use_tls;
    std::chrono::steady_clock::time_point m_last_used{
        std::chrono::steady_clock::now()};
};

/**
 * Bounded pool of backend connections owned by one worker io_context.
 *
 * A connection is leased for a single request/response exchange and goes
 * back to the pool when the Lease is destroyed, unless the holder discarded
 * it. When every connection is leased, acquire() waits for a release; the
 * wait is cancellable.
 */
class BackendPool {
  public:
    class Lease {
      public:
        Lease() = default;
        Lease(BackendPool &pool, std::unique_ptr<BackendConnection> connection)
            : m_pool(&pool), m_connection(std::move(connection))
        {}
        Lease(Lease &&other) noexcept;
        Lease &operator=(Lease &&other) noexcept;
        ~Lease() { release(); }

        Lease(const Lease &) = delete;
        Lease &operator=(const Lease &) = delete;

        BackendConnection &operator*() const { return *m_connection; }
        BackendConnection *operator->() const { return m_connection.get(); }
        explicit operator bool() const { return m_connection != nullptr; }

        // Drop the connection instead of returning it to the pool.
        void discard() { m_discard = true; }

      private:
        void release();

        BackendPool *m_pool{nullptr};
        std::unique_ptr<BackendConnection> m_connection;
        bool m_discard{false};
    };

    BackendPool(boost::asio::io_context &ioc, boost::asio::ssl::context &ctx,
                BackendConfig config);

    Lease acquire(Cancellation &cancellation, boost::asio::yield_context yield,
                  boost::beast::error_code &ec);

    void close_idle(boost::asio::yield_context yield);

    const BackendConfig &config() const { return m_config; }

    std::size_t open_connections() const { return m_open; }
    std::size_t idle_connections() const { return m_idle.size(); }

  private:
    void release(std::unique_ptr<BackendConnection> connection, bool discard);
    void wake_one();
    void connect(BackendConnection &connection, Cancellation &cancellation,
                 boost::asio::yield_context yield,
                 boost::beast::error_code &ec);

    boost::asio::io_context &m_ioc;
    boost::asio::ssl::context &m_ssl_context;
    BackendConfig m_config;
    std::optional<boost::asio::ip::tcp::resolver::results_type> m_endpoints;
    std::vector<std::unique_ptr<BackendConnection>> m_idle;
    std::deque<boost::asio::steady_timer *> m_waiters;
    std::size_t m_open{0};
};
