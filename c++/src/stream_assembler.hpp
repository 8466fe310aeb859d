#pragma once

#include <cstdint>

#include <boost/asio/spawn.hpp>
#include <boost/beast/core/error.hpp>

#include "byte_range.hpp"
#include "cancellation.hpp"
#include "chunk_fetcher.hpp"
#include "chunk_plan.hpp"
#include "file_handle.hpp"

struct StreamCursor
{
    std::uint64_t part_index{1};
    std::uint64_t offset{0};
    std::uint64_t bytes_emitted{0};
};

/**
 * Forward-only byte stream over one window of a remote file.
 *
 * Each pull() fetches the next aligned chunk and trims it to the window, so
 * the concatenated slices are exactly content[start..end]. An empty slice
 * without error is end of stream. The stream stops early, without error, when
 * the backend returns an empty chunk or a chunk shorter than the chunk size.
 * Once ended, by EOF or error, it stays ended.
 */
class ByteStream {
  public:
    ByteStream(ChunkFetcher &fetcher, FileHandle handle, const ByteRange &range,
               std::uint64_t chunk_size);

    bytes_t pull(Cancellation &cancellation, boost::asio::yield_context yield,
                 boost::beast::error_code &ec);

    bool finished() const { return m_finished; }

    const ByteRange &range() const { return m_range; }
    const ChunkPlan &plan() const { return m_plan; }
    const StreamCursor &cursor() const { return m_cursor; }

  private:
    ChunkFetcher &m_fetcher;
    FileHandle m_handle;
    ByteRange m_range;
    ChunkPlan m_plan;
    StreamCursor m_cursor;
    bool m_finished{false};
};

class StreamAssembler {
  public:
    explicit StreamAssembler(ChunkFetcher &fetcher,
                             std::uint64_t chunk_size = DEFAULT_CHUNK_SIZE)
        : m_fetcher(fetcher), m_chunk_size(chunk_size)
    {}

    ByteStream open(const FileHandle &handle, const ByteRange &range) const
    {
        return ByteStream{m_fetcher, handle, range, m_chunk_size};
    }

    std::uint64_t chunk_size() const { return m_chunk_size; }

  private:
    ChunkFetcher &m_fetcher;
    std::uint64_t m_chunk_size;
};
