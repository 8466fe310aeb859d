#include <algorithm>
#include <charconv>
#include <thread>
#include <utility>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <fmt/core.h>

#include "disconnect_watcher.hpp"
#include "log.hpp"
#include "request.hpp"
#include "server.hpp"
#include "stream_assembler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace io = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = io::ip::tcp;

ConnectionSet::Membership::Membership(ConnectionSet *set,
                                      beast::tcp_stream &client)
    : m_set(set), m_client(client)
{
    if (m_set)
    {
        m_set->m_members.insert(this);
    }
}

ConnectionSet::Membership::~Membership()
{
    if (m_set)
    {
        m_set->m_members.erase(this);
    }
}

void ConnectionSet::close_all()
{
    m_closing = true;
    auto members = m_members;
    for (auto *member : members)
    {
        if (member->m_cancellation)
        {
            member->m_cancellation->cancel();
        }
        member->m_client.cancel();
    }
}

static bool is_unreserved(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
           c == '~';
}

std::string download_link(std::string_view base_url, std::string_view link_id)
{
    while (!base_url.empty() && base_url.back() == '/')
    {
        base_url.remove_suffix(1);
    }
    std::string encoded;
    for (auto c : link_id)
    {
        if (is_unreserved(c))
            encoded += c;
        else
            encoded += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    }
    return fmt::format("{}/download/{}", base_url, encoded);
}

std::optional<std::string> decode_path_segment(std::string_view segment)
{
    std::string decoded;
    decoded.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); i++)
    {
        if (segment[i] != '%')
        {
            decoded += segment[i];
            continue;
        }
        if (i + 2 >= segment.size())
        {
            return std::nullopt;
        }
        unsigned int value = 0;
        auto digits = segment.substr(i + 1, 2);
        auto [ptr, ec] = std::from_chars(digits.data(),
                                         digits.data() + digits.size(), value,
                                         16);
        if (ec != std::errc() || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        decoded += static_cast<char>(value);
        i += 2;
    }
    return decoded;
}

static std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
    return s;
}

static bool handle_request(beast::tcp_stream &client,
                           beast::flat_buffer &buffer, const request_t &req,
                           const SessionContext &context,
                           Cancellation &cancellation, io::yield_context yield)
{
    constexpr std::string_view DOWNLOAD_PREFIX = "/download/";

    std::string_view path(req.target().data(), req.target().size());
    path = path.substr(0, path.find('?'));

    if (req.method() != http::verb::get)
    {
        auto res = make_text_response(http::status::method_not_allowed, req,
                                      "Method not allowed");
        res.set(http::field::allow, "GET");
        return send_response(client, std::move(res), cancellation, yield);
    }

    if (path == "/health")
    {
        return send_response(client,
                             make_text_response(http::status::ok, req, "OK"),
                             cancellation, yield);
    }

    if (!path.starts_with(DOWNLOAD_PREFIX))
    {
        return send_response(
            client, make_text_response(http::status::not_found, req, "Not found"),
            cancellation, yield);
    }

    auto link_id =
        decode_path_segment(trim(path.substr(DOWNLOAD_PREFIX.size())));
    if (!link_id || link_id->empty())
    {
        return send_response(client,
                             make_text_response(http::status::bad_request, req,
                                                "Invalid link"),
                             cancellation, yield);
    }

    DisconnectWatcher watcher(client, buffer, cancellation);
    watcher.start(yield);
    bool keep_alive = respond_download(client, req, *link_id, context.responder,
                                       cancellation, yield);
    watcher.stop(yield);
    return keep_alive && !cancellation.cancelled();
}

void serve_connection(beast::tcp_stream client, const SessionContext &context,
                      io::yield_context yield)
{
    ConnectionSet::Membership membership(context.connections, client);
    beast::error_code ec;
    beast::flat_buffer buffer;

    while (!membership.closing())
    {
        http::request_parser<http::empty_body> parser;
        client.expires_after(context.idle_timeout);
        http::async_read(client, buffer, parser, yield[ec]);
        if (ec == http::error::end_of_stream)
        {
            break;
        }
        if (ec)
        {
            const auto &parse_category =
                make_error_code(http::error::bad_method).category();
            if (ec.category() == parse_category && !membership.closing())
            {
                log_debug("malformed request: {}", ec.message());
                Cancellation cancellation;
                auto res = make_text_response(http::status::bad_request,
                                              request_t{}, "Bad request");
                res.keep_alive(false);
                send_response(client, std::move(res), cancellation, yield);
            }
            else if (ec != beast::error::timeout &&
                     ec != io::error::operation_aborted)
            {
                log_debug("read request: {}", ec.message());
            }
            break;
        }
        client.expires_never();
        context.responder.stats.request_received();

        const auto &req = parser.get();
        log_debug("{} {}", std::string(req.method_string()),
                  std::string(req.target()));

        Cancellation cancellation;
        membership.track(&cancellation);
        bool keep_alive =
            handle_request(client, buffer, req, context, cancellation, yield);
        membership.track(nullptr);
        if (!keep_alive)
        {
            break;
        }
    }

    client.socket().shutdown(tcp::socket::shutdown_send, ec);
}

class Server::Worker {
  public:
    Worker(const ServerConfig &config, ssl::context &ssl_context,
           MetadataStore &store, Stats &stats)
        : m_work(io::make_work_guard(m_ioc)),
          m_pool(m_ioc, ssl_context, config.backend), m_fetcher(m_pool),
          m_assembler(m_fetcher, config.chunk_size),
          m_context{ResponderContext{store, m_assembler, stats},
                    config.idle_timeout, &m_connections}
    {}

    io::io_context &context() { return m_ioc; }

    void run()
    {
        m_thread = std::thread([this] { m_ioc.run(); });
    }

    void serve(tcp::socket socket)
    {
        io::spawn(m_ioc,
                  [this, socket = std::move(socket)](
                      io::yield_context yield) mutable
                  {
                      serve_connection(beast::tcp_stream(std::move(socket)),
                                       m_context, yield);
                  });
    }

    // Aborts the connections, closes idle backend connections and lets the
    // thread run out of work.
    void stop()
    {
        io::post(m_ioc,
                 [this]
                 {
                     m_connections.close_all();
                     io::spawn(m_ioc, [this](io::yield_context yield)
                               { m_pool.close_idle(yield); });
                     m_work.reset();
                 });
    }

    void join()
    {
        if (m_thread.joinable())
        {
            m_thread.join();
        }
    }

  private:
    io::io_context m_ioc;
    io::executor_work_guard<io::io_context::executor_type> m_work;
    BackendPool m_pool;
    HttpChunkFetcher m_fetcher;
    StreamAssembler m_assembler;
    ConnectionSet m_connections;
    SessionContext m_context;
    std::thread m_thread;
};

Server::Server(ServerConfig config, MetadataStore &store,
               ssl::context &ssl_context, Stats &stats)
    : m_config(std::move(config)), m_store(store), m_ssl_context(ssl_context),
      m_stats(stats)
{}

Server::~Server()
{
    for (auto &worker : m_workers)
    {
        worker->stop();
    }
    join();
}

void Server::start(io::io_context &ioc)
{
    auto endpoint = tcp::endpoint{io::ip::make_address(m_config.address),
                                  m_config.port};
    m_acceptor = std::make_unique<tcp::acceptor>(ioc);
    m_acceptor->open(endpoint.protocol());
    m_acceptor->set_option(io::socket_base::reuse_address(true));
    m_acceptor->bind(endpoint);
    m_acceptor->listen(io::socket_base::max_listen_connections);

    auto threads = std::max<std::size_t>(m_config.threads, 1);
    for (std::size_t i = 0; i != threads; i++)
    {
        m_workers.push_back(std::make_unique<Worker>(m_config, m_ssl_context,
                                                     m_store, m_stats));
        m_workers.back()->run();
    }

    io::spawn(ioc, [this](io::yield_context yield) { accept_loop(yield); });
    log_info("HTTP server listening on {}:{} with {} worker(s)",
             m_acceptor->local_endpoint().address().to_string(),
             m_acceptor->local_endpoint().port(), threads);
}

void Server::stop()
{
    if (m_acceptor && m_acceptor->is_open())
    {
        beast::error_code ec;
        m_acceptor->close(ec);
    }
    for (auto &worker : m_workers)
    {
        worker->stop();
    }
}

void Server::join()
{
    for (auto &worker : m_workers)
    {
        worker->join();
    }
}

tcp::endpoint Server::local_endpoint() const
{
    return m_acceptor->local_endpoint();
}

void Server::accept_loop(io::yield_context yield)
{
    beast::error_code ec;
    while (m_acceptor->is_open())
    {
        auto &worker = *m_workers[m_next_worker];
        m_next_worker = (m_next_worker + 1) % m_workers.size();

        tcp::socket socket(worker.context());
        m_acceptor->async_accept(socket, yield[ec]);
        if (ec == io::error::operation_aborted)
        {
            break;
        }
        if (ec)
        {
            log_warning("accept: {}", ec.message());
            continue;
        }
        worker.serve(std::move(socket));
    }
}
