#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "catalog.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

namespace
{
constexpr auto CATALOG = R"(# link remote token reference size mime name
abc123 1001 77 0A0B0C 5000000 video/x-matroska My Holiday Movie.mkv

nohash 1002 -3 - 0 text/plain empty.txt
)";

class CatalogFile : public ::testing::Test {
  protected:
    void SetUp() override
    {
        auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_path = fs::temp_directory_path() /
                 (std::string("rangebridge_") + info->name() + ".catalog");
        write(CATALOG);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(m_path, ec);
    }

    void write(const std::string &content)
    {
        std::ofstream out(m_path, std::ios::trunc);
        out << content;
    }

    // Moves the mtime forward so a rewrite within the same clock tick is seen
    void touch_later()
    {
        fs::last_write_time(m_path, fs::last_write_time(m_path) +
                                        std::chrono::seconds(5));
    }

    fs::path m_path;
};
} // namespace

TEST(ReadCatalog, ParsesEntries)
{
    std::istringstream input(CATALOG);
    auto entries = read_catalog(input);

    ASSERT_EQ(entries.size(), 2u);
    const auto &movie = entries.at("abc123");
    EXPECT_EQ(movie.remote_id, 1001);
    EXPECT_EQ(movie.access_token, 77);
    EXPECT_EQ(movie.reference,
              (std::vector<unsigned char>{0x0A, 0x0B, 0x0C}));
    EXPECT_EQ(movie.total_size, 5'000'000u);
    EXPECT_EQ(movie.mime_type, "video/x-matroska");
    EXPECT_EQ(movie.file_name, "My Holiday Movie.mkv");

    const auto &empty = entries.at("nohash");
    EXPECT_EQ(empty.access_token, -3);
    EXPECT_TRUE(empty.reference.empty());
    EXPECT_EQ(empty.total_size, 0u);
}

TEST(ReadCatalog, KeepsNonAsciiFileNames)
{
    std::istringstream input("film 1 2 - 10 video/mp4 \xC3\x89t\xC3\xA9 \xE2\x80\x94 "
                             "\xE6\x98\xA0\xE7\x94\xBB.mp4\xC2\xA0\n");
    auto entries = read_catalog(input);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.at("film").file_name,
              "\xC3\x89t\xC3\xA9 \xE2\x80\x94 \xE6\x98\xA0\xE7\x94\xBB.mp4\xC2\xA0");
}

TEST(ReadCatalog, EmptyInputIsEmptyCatalog)
{
    std::istringstream input("\n# nothing here\n   \n");
    EXPECT_TRUE(read_catalog(input).empty());
}

TEST(ReadCatalog, RejectsMalformedLines)
{
    for (const char *text :
         {"abc 1 2 - 10 text/plain\n",        // no name
          "abc 1 2 -\n",                      // too few fields
          "abc x 2 - 10 text/plain a.txt\n",  // remote id
          "abc 1 2 - -10 text/plain a.txt\n", // size
          "abc 1 2 ZZ 10 text/plain a.txt\n", // hex
          "abc 1 2 ABC 10 text/plain a.txt\n"})
    {
        std::istringstream input(text);
        EXPECT_THROW(read_catalog(input), std::runtime_error) << text;
    }
}

TEST(ReadCatalog, ErrorNamesTheLine)
{
    std::istringstream input("# header\nok 1 2 - 10 text/plain a.txt\nbad\n");
    try
    {
        read_catalog(input);
        FAIL() << "expected an exception";
    }
    catch (const std::runtime_error &e)
    {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos)
            << e.what();
    }
}

TEST(ReadCatalog, RejectsDuplicateLinkIds)
{
    std::istringstream input("a 1 2 - 10 text/plain a.txt\n"
                             "a 3 4 - 20 text/plain b.txt\n");
    EXPECT_THROW(read_catalog(input), std::runtime_error);
}

TEST_F(CatalogFile, LooksUpLinks)
{
    CatalogMetadataStore store(m_path);
    boost::system::error_code ec;

    auto handle = store.lookup("abc123", ec);
    EXPECT_FALSE(ec);
    ASSERT_TRUE(handle);
    EXPECT_EQ(handle->file_name, "My Holiday Movie.mkv");

    EXPECT_FALSE(store.lookup("missing", ec));
    EXPECT_FALSE(ec);
    EXPECT_EQ(store.entries().size(), 2u);
}

TEST_F(CatalogFile, MissingFileThrows)
{
    EXPECT_THROW(CatalogMetadataStore(m_path.string() + ".absent"),
                 std::runtime_error);
}

TEST_F(CatalogFile, ReloadsWhenModified)
{
    CatalogMetadataStore store(m_path);
    write("fresh 5 6 FF 10 text/plain new.txt\n");
    touch_later();

    boost::system::error_code ec;
    auto handle = store.lookup("fresh", ec);
    EXPECT_FALSE(ec);
    ASSERT_TRUE(handle);
    EXPECT_EQ(handle->reference, (std::vector<unsigned char>{0xFF}));
    EXPECT_FALSE(store.lookup("abc123", ec));
    EXPECT_FALSE(ec);
}

TEST_F(CatalogFile, BrokenReloadKeepsPreviousEntries)
{
    CatalogMetadataStore store(m_path);
    write("this is not a catalog\n");
    touch_later();

    boost::system::error_code ec;
    EXPECT_FALSE(store.lookup("abc123", ec));
    EXPECT_EQ(ec, StreamError::metadata_unavailable);

    auto handle = store.lookup("abc123", ec);
    EXPECT_FALSE(ec);
    ASSERT_TRUE(handle);
    EXPECT_EQ(handle->remote_id, 1001);
}

TEST_F(CatalogFile, DeletedFileIsUnavailable)
{
    CatalogMetadataStore store(m_path);
    fs::remove(m_path);

    boost::system::error_code ec;
    EXPECT_FALSE(store.lookup("abc123", ec));
    EXPECT_EQ(ec, StreamError::metadata_unavailable);
}

TEST(MemoryMetadataStore, PutAndLookup)
{
    MemoryMetadataStore store;
    FileHandle handle;
    handle.remote_id = 9;
    handle.total_size = 123;
    store.put("link", handle);

    boost::system::error_code ec;
    auto found = store.lookup("link", ec);
    EXPECT_FALSE(ec);
    ASSERT_TRUE(found);
    EXPECT_EQ(found->remote_id, 9);
    EXPECT_FALSE(store.lookup("other", ec));
    EXPECT_FALSE(ec);
}
