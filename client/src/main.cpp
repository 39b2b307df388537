#include <cstdlib>
#include <exception>
#include <iostream>

#include "nanocloud/client/config.hpp"
#include "nanocloud/client/http_client.hpp"
#include "nanocloud/client/logger.hpp"
#include "nanocloud/client/uploader.hpp"
#include "nanocloud/version.hpp"

int main(int argc, char *argv[])
{
    nanocloud::client::ClientConfig config;
    try
    {
        config = nanocloud::client::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "NanoCloud uploader " << nanocloud::version() << "\n"
                  << ex.what() << "\n"
                  << nanocloud::client::usage(argv[0]) << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        nanocloud::client::Logger logger(config.log_path);
        nanocloud::client::HttpClient http(config.host, config.port, config.session_token);
        nanocloud::client::Uploader uploader(config, http, logger);
        return uploader.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Upload failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
