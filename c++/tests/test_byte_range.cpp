#include <gtest/gtest.h>

#include "byte_range.hpp"
#include "errors.hpp"

namespace
{
constexpr std::uint64_t FILE_SIZE = 5'000'000;

ByteRange parse_ok(std::string_view header, std::uint64_t size = FILE_SIZE)
{
    boost::system::error_code ec;
    auto range = parse_range(header, size, ec);
    EXPECT_FALSE(ec) << header << ": " << ec.message();
    return range;
}

boost::system::error_code parse_error(std::string_view header,
                                      std::uint64_t size = FILE_SIZE)
{
    boost::system::error_code ec;
    parse_range(header, size, ec);
    return ec;
}
} // namespace

TEST(ByteRange, AbsentHeaderSelectsWholeFile)
{
    auto range = parse_ok("");
    EXPECT_EQ(range.start, 0u);
    EXPECT_EQ(range.end, FILE_SIZE - 1);
    EXPECT_EQ(range.length, FILE_SIZE);
    EXPECT_TRUE(covers_whole_file(range, FILE_SIZE));
}

TEST(ByteRange, ClosedRange)
{
    auto range = parse_ok("bytes=0-1023");
    EXPECT_EQ(range.start, 0u);
    EXPECT_EQ(range.end, 1023u);
    EXPECT_EQ(range.length, 1024u);
    EXPECT_FALSE(covers_whole_file(range, FILE_SIZE));
}

TEST(ByteRange, SingleByte)
{
    auto range = parse_ok("bytes=4999999-4999999");
    EXPECT_EQ(range.start, 4999999u);
    EXPECT_EQ(range.length, 1u);
}

TEST(ByteRange, OpenEndedRunsToLastByte)
{
    auto range = parse_ok("bytes=1048576-");
    EXPECT_EQ(range.start, 1048576u);
    EXPECT_EQ(range.end, FILE_SIZE - 1);
    EXPECT_EQ(range.length, FILE_SIZE - 1048576);
}

TEST(ByteRange, OpenEndedFromZeroIsWholeFile)
{
    EXPECT_TRUE(covers_whole_file(parse_ok("bytes=0-"), FILE_SIZE));
}

TEST(ByteRange, SuffixMatchesEquivalentClosedRange)
{
    auto suffix = parse_ok("bytes=-500");
    auto closed = parse_ok("bytes=4999500-4999999");
    EXPECT_EQ(suffix.start, closed.start);
    EXPECT_EQ(suffix.end, closed.end);
    EXPECT_EQ(suffix.length, 500u);
}

TEST(ByteRange, SuffixLongerThanFileClampsToStart)
{
    auto range = parse_ok("bytes=-9000000");
    EXPECT_EQ(range.start, 0u);
    EXPECT_EQ(range.end, FILE_SIZE - 1);
}

TEST(ByteRange, WhitespaceAroundSpecIsIgnored)
{
    auto range = parse_ok("bytes= 10-19 ");
    EXPECT_EQ(range.start, 10u);
    EXPECT_EQ(range.length, 10u);
}

TEST(ByteRange, MultipleRangesAreNotSatisfiable)
{
    EXPECT_EQ(parse_error("bytes=0-10,20-30"),
              StreamError::range_not_satisfiable);
    EXPECT_EQ(parse_error("bytes=0-1,"), StreamError::range_not_satisfiable);
    EXPECT_EQ(parse_error("bytes=junk,0-1"),
              StreamError::range_not_satisfiable);
}

TEST(ByteRange, EndPastFileIsNotSatisfiable)
{
    EXPECT_EQ(parse_error("bytes=0-5000000"),
              StreamError::range_not_satisfiable);
    EXPECT_EQ(parse_error("bytes=6000000-"),
              StreamError::range_not_satisfiable);
}

TEST(ByteRange, EndBeforeStartIsNotSatisfiable)
{
    EXPECT_EQ(parse_error("bytes=100-99"), StreamError::range_not_satisfiable);
}

TEST(ByteRange, EmptySuffixIsNotSatisfiable)
{
    EXPECT_EQ(parse_error("bytes=-0"), StreamError::range_not_satisfiable);
}

TEST(ByteRange, MalformedSpecs)
{
    for (auto header : {"items=0-1", "bytes=", "bytes=-", "bytes=abc-",
                        "bytes=1-x", "bytes=+1-2", "bytes=-+5", "bytes=5",
                        "bytes=1-2-3", "bytes=99999999999999999999-"})
    {
        EXPECT_EQ(parse_error(header), StreamError::invalid_range_spec)
            << header;
    }
}

TEST(ByteRange, EmptyFile)
{
    auto range = parse_ok("", 0);
    EXPECT_EQ(range.length, 0u);
    EXPECT_TRUE(covers_whole_file(range, 0));

    EXPECT_EQ(parse_error("bytes=0-", 0), StreamError::range_not_satisfiable);
    EXPECT_EQ(parse_error("bytes=-1", 0), StreamError::range_not_satisfiable);
    EXPECT_EQ(parse_error("bytes=0-0", 0), StreamError::range_not_satisfiable);
}

TEST(ByteRange, HeaderValues)
{
    EXPECT_EQ(content_range(ByteRange{0, 1023, 1024}, FILE_SIZE),
              "bytes 0-1023/5000000");
    EXPECT_EQ(unsatisfied_content_range(FILE_SIZE), "bytes */5000000");
}
