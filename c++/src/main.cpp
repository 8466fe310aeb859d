#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options/errors.hpp>
#include <fmt/core.h>

#include "catalog.hpp"
#include "log.hpp"
#include "options.hpp"
#include "root_certificates.hpp"
#include "server.hpp"
#include "stats.hpp"
#include "timer.hpp"

namespace io = boost::asio;
namespace ssl = boost::asio::ssl;

void do_monitoring(io::steady_timer &timer, Stats &stats,
                   std::chrono::seconds interval, const bool &stopping,
                   io::yield_context yield)
{
    boost::system::error_code ec;
    while (!stopping)
    {
        timer.expires_after(interval);
        timer.async_wait(yield[ec]);
        if (stopping)
        {
            break;
        }
        stats.report();
    }
}

int main(int argc, char *argv[])
{
    Options options;
    try
    {
        options = parse_options(argc, argv);
    }
    catch (const boost::program_options::error &e)
    {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_FAILURE;
    }
    set_log_level(options.log_level);

    try
    {
        CatalogMetadataStore store{options.catalog_filename};

        if (options.print_links)
        {
            for (const auto &[link_id, handle] : store.entries())
            {
                fmt::print("{}\t{}\n", download_link(options.base_url, link_id),
                           handle.file_name);
            }
            return EXIT_SUCCESS;
        }

        log_info("Starting range bridge for backend {}:{}",
                 options.server.backend.host, options.server.backend.port);

        io::io_context ioc;

        // SSL context that holds the backend's trusted certificates
        ssl::context ctx{ssl::context::tlsv12_client};
        if (options.server.backend.use_tls)
        {
            load_root_certificates(ctx, options.ca_path);
            ctx.set_verify_mode(ssl::verify_peer);
        }

        Stats stats;
        Server server{options.server, store, ctx, stats};
        server.start(ioc);
        log_info("Download links will be: {}",
                 download_link(options.base_url, "{id}"));

        bool stopping = false;
        io::steady_timer monitor_timer(ioc);

        // Start an asynchronous wait for one of the signals to occur.
        io::signal_set signals_handler(ioc, SIGINT, SIGTERM);
        signals_handler.async_wait(
            [&](const boost::system::error_code &error, int signal_number)
            {
                if (error)
                {
                    return;
                }
                log_info("Received signal {}, shutting down", signal_number);
                stopping = true;
                server.stop();
                monitor_timer.cancel();
            });

        if (options.stats_interval > 0)
        {
            io::spawn(ioc,
                      [&](io::yield_context yield)
                      {
                          do_monitoring(
                              monitor_timer, stats,
                              std::chrono::seconds(options.stats_interval),
                              stopping, yield);
                      });
        }

        Timer timer;
        ioc.run();
        server.join();

        stats.report(true);
        log_info("Service stopped after {}", timer.get_fmt());
    }
    catch (const std::exception &e)
    {
        log_error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
