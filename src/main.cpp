#include <string>
#include <iostream>
#include <google/protobuf/stubs/common.h>
#include "ConfigurationManager.hpp"
#include "HttpClient.hpp"
#include "RealtimeFeedClient.hpp"
#include "Console.hpp"

void parseCommandLineArgs(int argc, char* argv[], std::string& dataPath)
{
    dataPath = ConfigurationManager::DEFAULT_STATIC_DATA;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--data" && i + 1 < argc)
        {
            dataPath = argv[++i];
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

int main(int argc, char* argv[])
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    int status = 0;
    try
    {
        std::string dataPath;
        parseCommandLineArgs(argc, argv, dataPath);

        ConfigurationManager config(dataPath);
        HttpClient http;
        RealtimeFeedClient feeds(config.getFeeds(), http);

        std::cout << "[System] Static data: " << config.getStaticDataPath() << "\n"
                  << "[System] Alerts feed: " << config.getFeeds().alertsUrl << "\n"
                  << "[System] Trip updates feed: " << config.getFeeds().tripUpdatesUrl << "\n"
                  << "[System] Vehicle positions feed: " << config.getFeeds().vehiclePositionsUrl << std::endl;

        Console console(std::cin, std::cout, feeds, config.getStaticDataPath());
        status = console.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        status = 1;
    }

    google::protobuf::ShutdownProtobufLibrary();
    return status;
}
