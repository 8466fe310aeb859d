#pragma once

#include <cstddef>
#include <string>

#include "log.hpp"
#include "server.hpp"

struct Options
{
    std::string catalog_filename;
    ServerConfig server;
    std::string ca_path;
    std::string base_url;
    std::size_t stats_interval{10};
    LogLevel log_level{LogLevel::info};
    bool print_links{false};
};

/**
 * Reads options from the command line, then from RANGEBRIDGE_* environment
 * variables for anything not given on the command line. Prints the help and
 * exits on --help.
 *
 * @throws boost::program_options::error on unknown or invalid options
 */
Options parse_options(int argc, char *argv[]);

/**
 * @throws boost::program_options::error if the combination is unusable
 */
void validate_options(const Options &options);
