#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/algorithm/hex.hpp>
#include <fmt/core.h>

#include "catalog.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "timer.hpp"

static inline bool not_space(char c)
{
    return !std::isspace(static_cast<unsigned char>(c));
}

static void trim(std::string &s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

template <typename T> static bool parse_integer(const std::string &s, T &out)
{
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size() && !s.empty();
}

static FileHandle parse_entry(std::istringstream &fields, std::size_t line_no)
{
    auto fail = [line_no](std::string_view what)
    {
        return std::runtime_error(
            fmt::format("catalog line {}: {}", line_no, what));
    };

    std::string remote_id, access_token, reference, size;
    FileHandle handle;
    if (!(fields >> remote_id >> access_token >> reference >> size >>
          handle.mime_type))
    {
        throw fail("expected 7 fields");
    }
    std::getline(fields, handle.file_name);
    trim(handle.file_name);
    if (handle.file_name.empty())
    {
        throw fail("missing file name");
    }
    if (!parse_integer(remote_id, handle.remote_id))
    {
        throw fail("bad remote id");
    }
    if (!parse_integer(access_token, handle.access_token))
    {
        throw fail("bad access token");
    }
    if (!parse_integer(size, handle.total_size))
    {
        throw fail("bad size");
    }
    if (reference != "-")
    {
        try
        {
            boost::algorithm::unhex(reference,
                                    std::back_inserter(handle.reference));
        }
        catch (const boost::algorithm::hex_decode_error &)
        {
            throw fail("bad hex reference");
        }
    }
    return handle;
}

catalog_t read_catalog(std::istream &input)
{
    catalog_t entries;
    std::size_t line_no = 0;
    for (std::string line; std::getline(input, line);)
    {
        ++line_no;
        trim(line);
        if (line.empty() || line.front() == '#')
        {
            continue;
        }
        std::istringstream fields(line);
        std::string link_id;
        fields >> link_id;
        auto handle = parse_entry(fields, line_no);
        if (!entries.emplace(std::move(link_id), std::move(handle)).second)
        {
            throw std::runtime_error(
                fmt::format("catalog line {}: duplicate link id", line_no));
        }
    }
    return entries;
}

static catalog_t load_catalog_file(const std::filesystem::path &path)
{
    Timer t;
    std::ifstream input(path);
    if (!input)
    {
        throw std::runtime_error(
            fmt::format("cannot open catalog '{}'", path.string()));
    }
    auto entries = read_catalog(input);
    log_info("Read {} catalog entries from {} in {}", entries.size(),
             path.string(), t.get_fmt());
    return entries;
}

CatalogMetadataStore::CatalogMetadataStore(std::filesystem::path path)
    : m_path(std::move(path))
{
    m_loaded_mtime = std::filesystem::last_write_time(m_path);
    m_entries = load_catalog_file(m_path);
}

std::optional<FileHandle>
CatalogMetadataStore::lookup(std::string_view link_id,
                             boost::system::error_code &ec)
{
    reload_if_changed(ec);
    if (ec)
    {
        return std::nullopt;
    }

    auto _lock = std::shared_lock{m_access_mutex};
    auto found = m_entries.find(link_id);
    if (found == m_entries.end())
    {
        return std::nullopt;
    }
    return found->second;
}

catalog_t CatalogMetadataStore::entries() const
{
    auto _lock = std::shared_lock{m_access_mutex};
    return m_entries;
}

void CatalogMetadataStore::reload_if_changed(boost::system::error_code &ec)
{
    ec = {};
    std::error_code fs_ec;
    auto mtime = std::filesystem::last_write_time(m_path, fs_ec);
    if (fs_ec)
    {
        log_error("catalog {}: {}", m_path.string(), fs_ec.message());
        ec = StreamError::metadata_unavailable;
        return;
    }
    {
        auto _lock = std::shared_lock{m_access_mutex};
        if (mtime == m_loaded_mtime)
        {
            return;
        }
    }

    auto _lock = std::unique_lock{m_access_mutex};
    if (mtime == m_loaded_mtime)
    {
        return;
    }
    m_loaded_mtime = mtime;
    try
    {
        m_entries = load_catalog_file(m_path);
    }
    catch (const std::runtime_error &e)
    {
        log_error("catalog reload failed, keeping previous entries: {}",
                  e.what());
        ec = StreamError::metadata_unavailable;
    }
}
