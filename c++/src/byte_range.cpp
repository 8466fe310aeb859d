#include <charconv>
#include <optional>

#include <fmt/core.h>

#include "byte_range.hpp"
#include "errors.hpp"

static std::string_view trim(std::string_view s)
{
    auto is_space = [](char c) { return c == ' ' || c == '\t'; };
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

static std::optional<std::uint64_t> parse_number(std::string_view s)
{
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty())
    {
        return std::nullopt;
    }
    return value;
}

ByteRange full_range(std::uint64_t total_size)
{
    if (total_size == 0)
    {
        return ByteRange{};
    }
    return ByteRange{0, total_size - 1, total_size};
}

ByteRange parse_range(std::string_view header, std::uint64_t total_size,
                      boost::system::error_code &ec)
{
    ec = {};
    header = trim(header);
    if (header.empty())
    {
        return full_range(total_size);
    }

    constexpr std::string_view BYTES_PREFIX = "bytes=";
    if (!header.starts_with(BYTES_PREFIX))
    {
        ec = StreamError::invalid_range_spec;
        return {};
    }
    auto spec = header.substr(BYTES_PREFIX.size());

    // Multiple ranges are never served, even when each one is valid.
    if (spec.find(',') != std::string_view::npos)
    {
        ec = StreamError::range_not_satisfiable;
        return {};
    }

    spec = trim(spec);
    auto dash = spec.find('-');
    if (dash == std::string_view::npos)
    {
        ec = StreamError::invalid_range_spec;
        return {};
    }
    auto first = spec.substr(0, dash);
    auto last = spec.substr(dash + 1);

    std::uint64_t start = 0;
    std::uint64_t end = 0;
    if (first.empty())
    {
        auto suffix = parse_number(last);
        if (!suffix)
        {
            ec = StreamError::invalid_range_spec;
            return {};
        }
        if (total_size == 0 || *suffix == 0)
        {
            ec = StreamError::range_not_satisfiable;
            return {};
        }
        start = *suffix >= total_size ? 0 : total_size - *suffix;
        end = total_size - 1;
    }
    else
    {
        auto parsed_start = parse_number(first);
        if (!parsed_start)
        {
            ec = StreamError::invalid_range_spec;
            return {};
        }
        start = *parsed_start;

        if (last.empty())
        {
            if (total_size == 0)
            {
                ec = StreamError::range_not_satisfiable;
                return {};
            }
            end = total_size - 1;
        }
        else
        {
            auto parsed_end = parse_number(last);
            if (!parsed_end)
            {
                ec = StreamError::invalid_range_spec;
                return {};
            }
            end = *parsed_end;
        }
    }

    if (end < start || end >= total_size)
    {
        ec = StreamError::range_not_satisfiable;
        return {};
    }
    return ByteRange{start, end, end - start + 1};
}

bool covers_whole_file(const ByteRange &range, std::uint64_t total_size)
{
    return range.start == 0 && range.length == total_size;
}

std::string content_range(const ByteRange &range, std::uint64_t total_size)
{
    return fmt::format("bytes {}-{}/{}", range.start, range.end, total_size);
}

std::string unsatisfied_content_range(std::uint64_t total_size)
{
    return fmt::format("bytes */{}", total_size);
}
