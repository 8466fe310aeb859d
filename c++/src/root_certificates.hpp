#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <boost/asio/ssl.hpp>

/**
 * Trusts the CA certificates at `path`: a bundle file, or a directory whose
 * *.pem and *.crt files are concatenated.
 *
 * @throws boost::system::system_error if no certificate could be added
 * @throws std::filesystem::filesystem_error if the path cannot be read
 */
inline void load_root_certificates(boost::asio::ssl::context &ctx,
                                   const std::filesystem::path &path)
{
    std::ostringstream cert_buffer;
    if (std::filesystem::is_directory(path))
    {
        for (const auto &entry : std::filesystem::directory_iterator(path))
        {
            auto extension = entry.path().extension().string();
            if (extension != ".pem" && extension != ".crt")
            {
                continue;
            }
            std::ifstream cert_data(entry.path());
            cert_buffer << cert_data.rdbuf() << '\n';
        }
    }
    else
    {
        std::ifstream cert_data(path);
        cert_buffer << cert_data.rdbuf();
    }

    boost::system::error_code ec;
    auto cert = cert_buffer.str();
    ctx.add_certificate_authority(boost::asio::buffer(cert.data(), cert.size()),
                                  ec);
    if (ec)
        throw boost::system::system_error{ec};
}
