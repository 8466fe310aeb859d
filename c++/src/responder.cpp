#include <cstdint>
#include <utility>

#include <boost/asio/write.hpp>

#include "byte_range.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "responder.hpp"
#include "timer.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace io = boost::asio;

static void cancel_client(beast::tcp_stream &client)
{
    beast::error_code ignored;
    client.socket().cancel(ignored);
}

std::string content_disposition(std::string_view file_name)
{
    std::string value = "attachment; filename=\"";
    for (auto c : file_name)
    {
        if (c == '"' || c == '\\')
        {
            value += '\\';
        }
        value += c;
    }
    value += '"';
    return value;
}

http::response<http::string_body> make_text_response(http::status status,
                                                     const request_t &req,
                                                     std::string body)
{
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

bool send_response(beast::tcp_stream &client,
                   http::response<http::string_body> &&res,
                   Cancellation &cancellation, io::yield_context yield)
{
    if (cancellation.cancelled())
    {
        return false;
    }
    beast::error_code ec;
    {
        Cancellation::Slot slot(cancellation,
                                [&client] { cancel_client(client); });
        http::async_write(client, res, yield[ec]);
    }
    if (ec)
    {
        log_debug("write response: {}", ec.message());
        return false;
    }
    return res.keep_alive();
}

bool respond_download(beast::tcp_stream &client, const request_t &req,
                      std::string_view link_id,
                      const ResponderContext &context,
                      Cancellation &cancellation, io::yield_context yield)
{
    auto &stats = context.stats;
    beast::error_code ec;

    auto handle = context.store.lookup(link_id, ec);
    if (ec)
    {
        log_error("lookup of link {}: {}", link_id, ec.message());
        return send_response(client,
                             make_text_response(
                                 http::status::internal_server_error, req,
                                 "Internal server error"),
                             cancellation, yield);
    }
    if (!handle)
    {
        stats.add_not_found();
        log_info("download {}: {}", link_id,
                 make_error_code(StreamError::link_not_found).message());
        return send_response(
            client,
            make_text_response(http::status::not_found, req, "File not found"),
            cancellation, yield);
    }

    auto range_field = req[http::field::range];
    std::string_view range_header(range_field.data(), range_field.size());
    auto range = parse_range(range_header, handle->total_size, ec);
    if (ec)
    {
        stats.add_unsatisfiable();
        log_info("download {}: range '{}': {}", link_id, range_header,
                 ec.message());
        http::response<http::string_body> res{
            http::status::range_not_satisfiable, req.version()};
        res.set(http::field::content_range,
                unsatisfied_content_range(handle->total_size));
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return send_response(client, std::move(res), cancellation, yield);
    }

    stats.download_started();
    log_info("download {} ({}): start={} end={} length={}", link_id,
             handle->file_name, range.start, range.end, range.length);
    Timer t;

    // The first slice is fetched before the status line so that an upstream
    // failure at this point can still be reported as a 500.
    auto stream = context.assembler.open(*handle, range);
    bytes_t chunk;
    if (range.length > 0)
    {
        chunk = stream.pull(cancellation, yield, ec);
        if (ec == StreamError::client_disconnected)
        {
            stats.add_client_disconnect();
            log_info("download {}: client went away before headers", link_id);
            return false;
        }
        if (ec)
        {
            stats.add_upstream_error();
            log_error("download {}: {}", link_id, ec.message());
            auto res = make_text_response(http::status::internal_server_error,
                                          req, "Internal server error");
            res.keep_alive(false);
            return send_response(client, std::move(res), cancellation, yield);
        }
    }

    bool whole_file = covers_whole_file(range, handle->total_size);
    http::response<http::empty_body> res{
        whole_file ? http::status::ok : http::status::partial_content,
        req.version()};
    res.set(http::field::accept_ranges, "bytes");
    res.set(http::field::content_type, handle->mime_type);
    res.set(http::field::content_disposition,
            content_disposition(handle->file_name));
    if (!whole_file)
    {
        res.set(http::field::content_range,
                content_range(range, handle->total_size));
    }
    res.content_length(range.length);
    res.keep_alive(req.keep_alive());

    http::response_serializer<http::empty_body> serializer{res};
    {
        Cancellation::Slot slot(cancellation,
                                [&client] { cancel_client(client); });
        http::async_write_header(client, serializer, yield[ec]);
    }
    if (ec)
    {
        stats.add_client_disconnect();
        log_info("download {}: writing headers: {}", link_id, ec.message());
        return false;
    }

    std::uint64_t sent = 0;
    while (!chunk.empty())
    {
        {
            Cancellation::Slot slot(cancellation,
                                    [&client] { cancel_client(client); });
            io::async_write(client, io::buffer(chunk), yield[ec]);
        }
        if (ec)
        {
            stats.add_client_disconnect();
            log_info("download {}: client gone after {} bytes", link_id, sent);
            return false;
        }
        sent += chunk.size();
        stats.bytes_streamed(chunk.size());

        chunk = stream.pull(cancellation, yield, ec);
        if (ec == StreamError::client_disconnected)
        {
            stats.add_client_disconnect();
            log_info("download {}: client gone after {} bytes", link_id, sent);
            return false;
        }
        if (ec)
        {
            // The status line is out: all that is left is to drop the
            // connection.
            stats.add_upstream_error();
            log_error("download {}: aborted after {} of {} bytes: {}", link_id,
                      sent, range.length, ec.message());
            return false;
        }
    }

    if (sent < range.length)
    {
        stats.add_truncated_stream();
        log_warning("download {}: backend ran out after {} of {} bytes",
                    link_id, sent, range.length);
        return false;
    }
    log_info("download {}: {} bytes in {}", link_id, sent, t.get_fmt());
    return res.keep_alive();
}
