#include <iterator>
#include <string>
#include <utility>

#include <boost/algorithm/hex.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <fmt/core.h>

#include "errors.hpp"
#include "log.hpp"
#include "request.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace io = boost::asio;

static std::string hex_reference(const std::vector<unsigned char> &reference)
{
    std::string hex;
    boost::algorithm::hex(reference.begin(), reference.end(),
                          std::back_inserter(hex));
    return hex;
}

std::string chunk_target(const BackendConfig &config, const FileHandle &handle,
                         std::uint64_t offset, std::uint64_t limit)
{
    return fmt::format("{}/{}?offset={}&limit={}", config.target_prefix,
                       handle.remote_id, offset, limit);
}

std::tuple<bytes_t, bool>
request_chunk(BackendConnection &connection, const BackendConfig &config,
              const FileHandle &handle, std::uint64_t offset,
              std::uint64_t limit, io::yield_context yield,
              beast::error_code &ec)
{
    http::request<http::empty_body> req{
        http::verb::get, chunk_target(config, handle, offset, limit), 11};
    req.set(http::field::host, config.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set("X-Access-Token", std::to_string(handle.access_token));
    req.set("X-File-Reference", hex_reference(handle.reference));

    connection.visit([&](auto &stream)
                     { http::async_write(stream, req, yield[ec]); });
    if (ec)
        return std::make_tuple(bytes_t{}, true);

    http::response_parser<http::vector_body<char>> parser;
    parser.body_limit(limit);
    connection.visit(
        [&](auto &stream)
        { http::async_read(stream, connection.buffer(), parser, yield[ec]); });
    if (ec)
        return std::make_tuple(bytes_t{}, true);

    auto response = parser.release();
    bool close_connection = !response.keep_alive();
    auto status = response.result_int();
    if (status >= 300 && status < 400)
    {
        log_warning("backend redirected file {} offset {} to '{}'",
                    handle.remote_id, offset,
                    std::string(response[http::field::location]));
        ec = StreamError::upstream_redirect_unsupported;
        return std::make_tuple(bytes_t{}, close_connection);
    }
    if (status != 200 && status != 206)
    {
        log_warning("backend status {} for file {} offset {}", status,
                    handle.remote_id, offset);
        ec = StreamError::upstream_transport_error;
        return std::make_tuple(bytes_t{}, close_connection);
    }

    return std::make_tuple(std::move(response.body()), close_connection);
}

bytes_t HttpChunkFetcher::fetch(const FileHandle &handle, std::uint64_t offset,
                                std::uint64_t limit,
                                Cancellation &cancellation,
                                io::yield_context yield, beast::error_code &ec)
{
    auto lease = m_pool.acquire(cancellation, yield, ec);
    if (ec)
        return {};

    Cancellation::Slot slot(cancellation, [&lease] { lease->cancel(); });
    auto [chunk, close_connection] = request_chunk(
        *lease, m_pool.config(), handle, offset, limit, yield, ec);
    if (close_connection)
    {
        lease.discard();
    }
    if (ec)
    {
        if (cancellation.cancelled())
        {
            ec = StreamError::client_disconnected;
        }
        else if (ec.category() != stream_category())
        {
            log_warning("backend request for file {} offset {}: {}",
                        handle.remote_id, offset, ec.message());
            ec = StreamError::upstream_transport_error;
        }
        return {};
    }

    log_debug("fetched {} bytes of file {} at offset {}", chunk.size(),
              handle.remote_id, offset);
    return std::move(chunk);
}
