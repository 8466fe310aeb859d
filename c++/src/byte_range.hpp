#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/system/error_code.hpp>

/**
 * Inclusive byte window [start, end] of a file. For a zero-byte file the full
 * range is {0, 0, 0}, the only range with length 0.
 */
struct ByteRange
{
    std::uint64_t start{0};
    std::uint64_t end{0};
    std::uint64_t length{0};
};

ByteRange full_range(std::uint64_t total_size);

/**
 * Parses a single-range "Range" header against the content length.
 *
 * An empty header selects the whole file. On failure ec is set to
 * StreamError::invalid_range_spec or StreamError::range_not_satisfiable and
 * the returned range is meaningless; both map to a 416 response.
 *
 * @param header The raw header value, empty when the header is absent
 * @param total_size The file size in bytes
 * @param ec Set on failure
 */
ByteRange parse_range(std::string_view header, std::uint64_t total_size,
                      boost::system::error_code &ec);

bool covers_whole_file(const ByteRange &range, std::uint64_t total_size);

// "bytes <start>-<end>/<total>"
std::string content_range(const ByteRange &range, std::uint64_t total_size);

// "bytes */<total>"
std::string unsatisfied_content_range(std::uint64_t total_size);
