#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>

#include <boost/program_options.hpp>
#include <fmt/core.h>

#include "chunk_fetcher.hpp"
#include "options.hpp"

namespace po = boost::program_options;

constexpr std::string_view ENV_PREFIX = "RANGEBRIDGE_";

Options parse_options(int argc, char *argv[])
{
    Options options;
    std::size_t idle_timeout = 30;
    std::size_t pool_idle_ttl = 30;
    std::string log_level;
    bool backend_plain = false;

    po::options_description desc("Allowed options");
    po::positional_options_description positional;
    positional.add("catalog", 1);
    desc.add_options()("help,h", "show this help message")(
        "catalog,c", po::value<std::string>(&options.catalog_filename),
        "catalog file mapping link ids to remote files")(
        "listen,l",
        po::value<std::string>(&options.server.address)
            ->default_value("0.0.0.0"),
        "address to listen on")(
        "port,p",
        po::value<unsigned short>(&options.server.port)->default_value(8080),
        "port to listen on")(
        "threads,t",
        po::value<std::size_t>(&options.server.threads)->default_value(1),
        "number of worker threads")(
        "backend-host", po::value<std::string>(&options.server.backend.host),
        "chunk backend host name")(
        "backend-port",
        po::value<std::string>(&options.server.backend.port)
            ->default_value("443"),
        "chunk backend port")(
        "backend-prefix",
        po::value<std::string>(&options.server.backend.target_prefix)
            ->default_value("/files"),
        "path prefix of chunk requests")(
        "backend-plain", po::bool_switch(&backend_plain),
        "talk to the backend without TLS")(
        "ca-path",
        po::value<std::string>(&options.ca_path)
            ->default_value("/etc/ssl/certs"),
        "CA bundle file or directory of PEM certificates")(
        "pool-size,w",
        po::value<std::size_t>(&options.server.backend.max_connections)
            ->default_value(4),
        "backend connections per worker thread")(
        "pool-idle-ttl", po::value<std::size_t>(&pool_idle_ttl)->default_value(30),
        "seconds an idle backend connection may be reused")(
        "chunk-size",
        po::value<std::uint64_t>(&options.server.chunk_size)
            ->default_value(DEFAULT_CHUNK_SIZE),
        "bytes per backend fetch, a multiple of 1 MiB")(
        "idle-timeout", po::value<std::size_t>(&idle_timeout)->default_value(30),
        "seconds to wait for the next request on a client connection")(
        "stats-interval,s",
        po::value<std::size_t>(&options.stats_interval)->default_value(10),
        "seconds between statistics lines (0 = off)")(
        "base-url",
        po::value<std::string>(&options.base_url)
            ->default_value("http://localhost:8080"),
        "public base URL of download links")(
        "log-level", po::value<std::string>(&log_level)->default_value("info"),
        "debug, info, warning or error")(
        "print-links", po::bool_switch(&options.print_links),
        "print the download link of every catalog entry and exit");

    auto env_mapper = [&desc](const std::string &variable) -> std::string
    {
        if (!variable.starts_with(ENV_PREFIX))
        {
            return "";
        }
        auto name = variable.substr(ENV_PREFIX.size());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c)
                       {
                           return c == '_' ? '-'
                                           : static_cast<char>(std::tolower(c));
                       });
        if (desc.find_nothrow(name, false) == nullptr)
        {
            return "";
        }
        return name;
    };

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    po::store(po::parse_environment(desc, env_mapper), vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        std::cout << desc << '\n';
        exit(EXIT_SUCCESS);
    }
    else if (vm.count("catalog") == 0)
    {
        throw po::error("A <catalog> file must be given. Use -h to see the "
                        "help");
    }

    options.server.backend.use_tls = !backend_plain;
    options.server.backend.idle_ttl = std::chrono::seconds(pool_idle_ttl);
    options.server.idle_timeout = std::chrono::seconds(idle_timeout);
    try
    {
        options.log_level = parse_log_level(log_level);
    }
    catch (const std::invalid_argument &e)
    {
        throw po::error(e.what());
    }

    validate_options(options);
    return options;
}

void validate_options(const Options &options)
{
    auto chunk_size = options.server.chunk_size;
    if (chunk_size == 0 || chunk_size % CHUNK_ALIGNMENT != 0)
    {
        throw po::error(fmt::format(
            "--chunk-size must be a positive multiple of {}, got {}",
            CHUNK_ALIGNMENT, chunk_size));
    }
    if (options.server.threads == 0)
    {
        throw po::error("--threads must be at least 1");
    }
    if (options.server.backend.max_connections == 0)
    {
        throw po::error("--pool-size must be at least 1");
    }
    if (!options.print_links && options.server.backend.host.empty())
    {
        throw po::error("--backend-host is required");
    }
}
