#include <exception>
#include <iostream>
#include <utility>

#include "snapvault/client/config.hpp"
#include "snapvault/client/logger.hpp"
#include "snapvault/client/session.hpp"

int main(int argc, char *argv[])
{
    try
    {
        auto config = snapvault::client::parse_arguments(argc, argv);
        snapvault::client::TransferLog logger(config.log_path);
        snapvault::client::ClientSession session(std::move(config), std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
