#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

#include "errors.hpp"
#include "log.hpp"
#include "stream_assembler.hpp"

ByteStream::ByteStream(ChunkFetcher &fetcher, FileHandle handle,
                       const ByteRange &range, std::uint64_t chunk_size)
    : m_fetcher(fetcher), m_handle(std::move(handle)), m_range(range),
      m_plan(make_chunk_plan(range, chunk_size))
{
    m_cursor.offset = m_plan.aligned_offset;
    log_debug("stream plan for {}: offset={} parts={} lead={} trail={}",
              m_handle.remote_id, m_plan.aligned_offset, m_plan.part_count,
              m_plan.leading_trim, m_plan.trailing_trim);
}

bytes_t ByteStream::pull(Cancellation &cancellation,
                         boost::asio::yield_context yield,
                         boost::beast::error_code &ec)
{
    ec = {};
    if (m_finished || m_cursor.part_index > m_plan.part_count)
    {
        m_finished = true;
        return {};
    }
    if (cancellation.cancelled())
    {
        m_finished = true;
        ec = StreamError::client_disconnected;
        return {};
    }

    auto chunk = m_fetcher.fetch(m_handle, m_cursor.offset, m_plan.chunk_size,
                                 cancellation, yield, ec);
    if (ec || chunk.empty())
    {
        m_finished = true;
        return {};
    }

    // A short chunk ends the stream after its bytes are delivered.
    bool short_chunk = chunk.size() < m_plan.chunk_size;

    std::uint64_t first =
        m_cursor.part_index == 1 ? m_plan.leading_trim : 0;
    std::uint64_t last = m_cursor.part_index == m_plan.part_count
                             ? m_plan.trailing_trim
                             : chunk.size();
    last = std::min<std::uint64_t>(last, chunk.size());
    if (first >= last)
    {
        m_finished = true;
        return {};
    }
    chunk.erase(std::next(chunk.begin(), static_cast<std::ptrdiff_t>(last)),
                chunk.end());
    chunk.erase(chunk.begin(),
                std::next(chunk.begin(), static_cast<std::ptrdiff_t>(first)));

    m_cursor.part_index++;
    m_cursor.offset += m_plan.chunk_size;
    m_cursor.bytes_emitted += chunk.size();
    if (short_chunk)
    {
        m_finished = true;
    }
    return chunk;
}
