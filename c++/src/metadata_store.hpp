#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include <boost/system/error_code.hpp>

#include "file_handle.hpp"

class MetadataStore {
  public:
    virtual ~MetadataStore() = default;

    /**
     * Resolves a link identifier to a file handle.
     *
     * @return The handle, or std::nullopt when the link is unknown or the
     *         store failed (ec is set to StreamError::metadata_unavailable)
     */
    virtual std::optional<FileHandle>
    lookup(std::string_view link_id, boost::system::error_code &ec) = 0;
};

class MemoryMetadataStore : public MetadataStore {
  public:
    void put(std::string link_id, FileHandle handle)
    {
        auto _lock = std::unique_lock{m_access_mutex};
        m_handles[std::move(link_id)] = std::move(handle);
    }

    std::optional<FileHandle> lookup(std::string_view link_id,
                                     boost::system::error_code &ec) override
    {
        ec = {};
        auto _lock = std::shared_lock{m_access_mutex};
        auto found = m_handles.find(link_id);
        if (found == m_handles.end())
        {
            return std::nullopt;
        }
        return found->second;
    }

  private:
    mutable std::shared_mutex m_access_mutex;
    std::map<std::string, FileHandle, std::less<>> m_handles;
};
