#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>

#include "backend_pool.hpp"
#include "cancellation.hpp"
#include "chunk_fetcher.hpp"
#include "metadata_store.hpp"
#include "responder.hpp"
#include "stats.hpp"

struct ServerConfig
{
    std::string address{"0.0.0.0"};
    unsigned short port{8080};
    std::size_t threads{1};
    std::chrono::seconds idle_timeout{30};
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    BackendConfig backend;
};

/**
 * Client connections served by one worker, so that shutdown can abort them.
 * Used from the worker's thread only.
 */
class ConnectionSet {
  public:
    class Membership {
      public:
        Membership(ConnectionSet *set, boost::beast::tcp_stream &client);
        ~Membership();

        Membership(const Membership &) = delete;
        Membership &operator=(const Membership &) = delete;

        // The cancellation of the request in progress, or nullptr between
        // requests
        void track(Cancellation *cancellation) { m_cancellation = cancellation; }

        bool closing() const { return m_set && m_set->m_closing; }

      private:
        friend class ConnectionSet;

        ConnectionSet *m_set;
        boost::beast::tcp_stream &m_client;
        Cancellation *m_cancellation{nullptr};
    };

    void close_all();

  private:
    std::unordered_set<Membership *> m_members;
    bool m_closing{false};
};

struct SessionContext
{
    ResponderContext responder;
    std::chrono::seconds idle_timeout{30};
    ConnectionSet *connections{nullptr};
};

// "<base url>/download/<link id>", with the link id percent-encoded
std::string download_link(std::string_view base_url, std::string_view link_id);

/**
 * Decodes %XX escapes in one path segment. '+' is kept as is.
 *
 * @return The decoded segment, or std::nullopt for a truncated or non-hex
 *         escape
 */
std::optional<std::string> decode_path_segment(std::string_view segment);

/**
 * Serves HTTP/1.1 requests on one client connection until the client closes
 * it, an error occurs, or the connection set is closed.
 */
void serve_connection(boost::beast::tcp_stream client,
                      const SessionContext &context,
                      boost::asio::yield_context yield);

/**
 * Accepts on the caller's io_context and hands each connection to one of
 * `threads` workers. Every worker owns an io_context thread, a backend pool
 * and the streams of its connections.
 */
class Server {
  public:
    Server(ServerConfig config, MetadataStore &store,
           boost::asio::ssl::context &ssl_context, Stats &stats);
    ~Server();

    /**
     * Binds the listener and starts the worker threads.
     *
     * @throws boost::system::system_error if the address cannot be bound
     */
    void start(boost::asio::io_context &ioc);

    // Closes the listener and aborts every connection. Call from the thread
    // running the io_context passed to start().
    void stop();

    void join();

    boost::asio::ip::tcp::endpoint local_endpoint() const;

  private:
    class Worker;

    void accept_loop(boost::asio::yield_context yield);

    ServerConfig m_config;
    MetadataStore &m_store;
    boost::asio::ssl::context &m_ssl_context;
    Stats &m_stats;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> m_acceptor;
    std::vector<std::unique_ptr<Worker>> m_workers;
    std::size_t m_next_worker{0};
};
