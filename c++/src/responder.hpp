#pragma once

#include <string>
#include <string_view>

#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "cancellation.hpp"
#include "metadata_store.hpp"
#include "stats.hpp"
#include "stream_assembler.hpp"

using request_t = boost::beast::http::request<boost::beast::http::empty_body>;

struct ResponderContext
{
    MetadataStore &store;
    const StreamAssembler &assembler;
    Stats &stats;
};

// attachment; filename="<name>" with quotes and backslashes escaped
std::string content_disposition(std::string_view file_name);

boost::beast::http::response<boost::beast::http::string_body>
make_text_response(boost::beast::http::status status, const request_t &req,
                   std::string body);

/**
 * Writes a complete response, aborting if the cancellation fires.
 *
 * @return Whether the connection may serve another request
 */
bool send_response(
    boost::beast::tcp_stream &client,
    boost::beast::http::response<boost::beast::http::string_body> &&res,
    Cancellation &cancellation, boost::asio::yield_context yield);

/**
 * Serves one download: resolves the link, validates the Range header and
 * streams the selected bytes from the backend to the client.
 *
 * Errors found before the status line is written become 404, 416 or 500
 * responses. After that the only possible reaction to a failure is to stop
 * writing and close the connection.
 *
 * @return Whether the connection may serve another request
 */
bool respond_download(boost::beast::tcp_stream &client, const request_t &req,
                      std::string_view link_id,
                      const ResponderContext &context,
                      Cancellation &cancellation,
                      boost::asio::yield_context yield);
