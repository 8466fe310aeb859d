#pragma once

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "metadata_store.hpp"

using catalog_t = std::map<std::string, FileHandle, std::less<>>;

/**
 * Reads catalog entries, one per line:
 *
 *   <link id> <remote id> <access token> <hex reference|-> <size> <mime> <name>
 *
 * The file name is the rest of the line. Blank lines and '#' comments are
 * skipped.
 *
 * @throws std::runtime_error naming the first malformed line
 */
catalog_t read_catalog(std::istream &input);

// Metadata store backed by a catalog file, reloaded when its mtime changes.
class CatalogMetadataStore : public MetadataStore {
  public:
    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    explicit CatalogMetadataStore(std::filesystem::path path);

    std::optional<FileHandle> lookup(std::string_view link_id,
                                     boost::system::error_code &ec) override;

    // Snapshot of every entry, for listing links.
    catalog_t entries() const;

  private:
    void reload_if_changed(boost::system::error_code &ec);

    std::filesystem::path m_path;
    mutable std::shared_mutex m_access_mutex;
    catalog_t m_entries;
    std::filesystem::file_time_type m_loaded_mtime;
};
