#pragma once

#include <cstdint>
#include <string>
#include <tuple>

#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>

#include "backend_pool.hpp"
#include "chunk_fetcher.hpp"
#include "file_handle.hpp"

// "<prefix>/<remote id>?offset=<offset>&limit=<limit>"
std::string chunk_target(const BackendConfig &config, const FileHandle &handle,
                         std::uint64_t offset, std::uint64_t limit);

/**
 * Runs one chunk request/response exchange on a backend connection.
 *
 * @return The chunk bytes, and whether the connection must not be reused
 */
std::tuple<bytes_t, bool>
request_chunk(BackendConnection &connection, const BackendConfig &config,
              const FileHandle &handle, std::uint64_t offset,
              std::uint64_t limit, boost::asio::yield_context yield,
              boost::beast::error_code &ec);

// Fetches chunks over HTTP, leasing one pooled connection per call.
class HttpChunkFetcher : public ChunkFetcher {
  public:
    explicit HttpChunkFetcher(BackendPool &pool) : m_pool(pool) {}

    bytes_t fetch(const FileHandle &handle, std::uint64_t offset,
                  std::uint64_t limit, Cancellation &cancellation,
                  boost::asio::yield_context yield,
                  boost::beast::error_code &ec) override;

  private:
    BackendPool &m_pool;
};
