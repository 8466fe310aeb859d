#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Everything needed to fetch one remote file. Loaded per request and never
// reused across requests: the access token and reference may go stale.
struct FileHandle
{
    std::int64_t remote_id{0};
    std::int64_t access_token{0};
    std::vector<unsigned char> reference;
    std::uint64_t total_size{0};
    std::string mime_type;
    std::string file_name;
};
