#pragma once

#include <cstdint>
#include <vector>

#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>

#include "cancellation.hpp"
#include "file_handle.hpp"

using bytes_t = std::vector<char>;

// Smallest offset alignment the chunk backend accepts.
constexpr std::uint64_t CHUNK_ALIGNMENT = 1024 * 1024;
constexpr std::uint64_t DEFAULT_CHUNK_SIZE = CHUNK_ALIGNMENT;

class ChunkFetcher {
  public:
    virtual ~ChunkFetcher() = default;

    /**
     * Fetches the chunk starting at an aligned offset.
     *
     * An empty result with no error is end of data. Errors are not retried;
     * a fired cancellation makes the call return promptly with
     * StreamError::client_disconnected.
     *
     * @param handle The remote file
     * @param offset Aligned offset of the chunk
     * @param limit Chunk size
     */
    virtual bytes_t fetch(const FileHandle &handle, std::uint64_t offset,
                          std::uint64_t limit, Cancellation &cancellation,
                          boost::asio::yield_context yield,
                          boost::beast::error_code &ec) = 0;
};
