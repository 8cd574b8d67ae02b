#include <exception>
#include <iostream>
#include <utility>

#include "xferstat/client/config.hpp"
#include "xferstat/client/logger.hpp"
#include "xferstat/client/session.hpp"

int main(int argc, char *argv[])
{
    try
    {
        const auto config = xferstat::client::parse_arguments(argc, argv);
        xferstat::client::Logger logger(config.log_path);
        xferstat::client::ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
