#include <string>
#include <memory>
#include <thread>
#include <vector>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <utility>
#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include "ConfigurationManager.hpp"
#include "SQLiteStore.hpp"
#include "InMemoryCache.hpp"
#include "MemcachedClient.hpp"
#include "FeedService.hpp"
#include "EndpointRouter.hpp"
#include "HttpServer.hpp"
#include "ChangeListener.hpp"
#include "Listener.hpp"

namespace bpo = boost::program_options;

std::unique_ptr<ResponseCache> createCache(ConfigurationManager const& config)
{
    if (!config.getServer().cachingEnabled)
    {
        std::cout << "[Cache] Caching disabled." << std::endl;
        return nullptr;
    }

    CacheSettings const& caching = config.getCaching();
    if (caching.serverEndpoint == ConfigurationManager::MEMORY_CACHE)
    {
        std::cout << "[Cache] Using in-process cache." << std::endl;
        return std::make_unique<InMemoryCache>();
    }

    auto [host, port] = ConfigurationManager::splitEndpoint(caching.serverEndpoint);
    std::cout << "[Cache] Using memcached at " << host << ":" << port << std::endl;
    return std::make_unique<MemcachedClient>(host, port, caching.timeout);
}

bool parseCommandLineArgs(int argc, char* argv[], std::string& databasePath, std::string& configPath)
{
    bpo::options_description desc("Options");
    desc.add_options()
        ("help,h", "produce this help message")
        ("database,d", bpo::value(&databasePath)->required(), "SQLite database holding the realtime tables")
        ("config,c", bpo::value(&configPath), "configuration file (INI)");

    bpo::variables_map vm;
    bpo::store(bpo::command_line_parser(argc, argv).options(desc).run(), vm);

    if (vm.count("help"))
    {
        std::cout << desc << "\n";
        return false;
    }

    bpo::notify(vm);

    if (configPath.empty())
    {
        if (const char* envConfig = std::getenv(ConfigurationManager::CONFIG_ENV.c_str()))
            configPath = envConfig;
    }

    return true;
}

int main(int argc, char* argv[])
{
    try
    {
        std::string databasePath;
        std::string configPath;

        if (!parseCommandLineArgs(argc, argv, databasePath, configPath))
            return 0;

        ConfigurationManager config;
        if (!configPath.empty())
            config.load(configPath);
        else
            std::cout << "[System] No configuration given, using defaults." << std::endl;

        SQLiteStore db(databasePath);
        std::unique_ptr<ResponseCache> cache = createCache(config);
        FeedService feeds(db, cache.get(), config);

        ServerSettings const& settings = config.getServer();
        HttpServer server(feeds, EndpointRouter(config.getRoutes()), settings.corsEnabled);

        LoggingListener logger;
        std::unique_ptr<ChangeListener> listener;
        if (config.getNotifications().enabled)
        {
            listener = std::make_unique<ChangeListener>(config.getNotifications().broker, logger);
            listener->start();
        }

        boost::asio::io_context ioc(static_cast<int>(settings.workerThreads));
        boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(settings.address), settings.port);
        server.listen(ioc, endpoint);

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc](boost::system::error_code const&, int)
        {
            std::cout << "[System] Shutting down." << std::endl;
            ioc.stop();
        });

        std::cout << "System Initialized.\n";

        auto runWorker = [&ioc]()
        {
            try
            {
                ioc.run();
            }
            catch (std::exception const& e)
            {
                std::cerr << "Server Error: " << e.what() << std::endl;
                ioc.stop();
            }
        };

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < settings.workerThreads; ++i)
            workers.emplace_back(runWorker);

        runWorker();

        for (auto& worker : workers)
            worker.join();

        if (listener)
            listener->stop();
    }
    catch (bpo::error const& e)
    {
        std::cerr << "Usage Error: " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
