//offline_agent/src/main.cpp

#include <iostream>
#include <memory>
#include <string>
#include <netinet/in.h>
#include <unistd.h>

#include "server.hpp"
#include "threadPool.hpp"
#include "connHandler.hpp"
#include "logger.hpp"
#include "config.hpp"
#include "agent.hpp"
#include "memoryStore.hpp"
#include "sqliteStore.hpp"
#include "fetcher.hpp"

static void printUsage(const char *prog){
    std::cout << "Usage: " << prog << " [config.json]\n"
              << "  Runs the offline caching agent with the settings from the given file\n"
              << "  (default: config.json in the working directory).\n";
}

int main(int argc, char **argv){
    std::string configPath = "config.json";
    if(argc > 1){
        std::string arg = argv[1];
        if(arg == "-h" || arg == "--help"){
            printUsage(argv[0]);
            return 0;
        }
        configPath = arg;
    }

    AgentConfig config;
    if(!config.loadFromFile(configPath)){
        return 1;
    }
    if(!Logger::getInstance().open(config.logPath)){
        std::cerr << "cannot open log file " << config.logPath << ", keeping the default" << std::endl;
    }

    std::unique_ptr<NamespaceStore> store;
    try {
        if(config.storePath.empty()){
            store = std::make_unique<MemoryStore>();
        }
        else{
            store = std::make_unique<SqliteStore>(config.storePath);
        }
    }
    catch (const StoreError &e) {
        std::cerr << "Store error: " << e.what() << std::endl;
        return 1;
    }

    HttpFetcher fetcher(config.networkTimeout);
    Agent agent(config, *store, fetcher);

    InstallReport report = agent.start();
    if(!report.ok){
        std::cerr << "Install of version " << config.version << " failed" << std::endl;
        return 1;
    }
    if(!report.failedAssets.empty()){
        std::cerr << report.failedAssets.size() << " of " << report.attempted
                  << " assets could not be cached, continuing" << std::endl;
    }
    agent.startMaintenance();

    Server server(config.listenPort);
    //basic guarantee
    //When an exception occurs, the server can maintain a consistent state
    //without achieving the strong guarantee of "not changing the state at all".
    try {
        Server::setUpSignalHandler();
        server.init();
        std::cout << "Offline agent " << config.version << " listening on port "
                  << server.get_port() << std::endl;
    }
    catch (const std::exception &e) {
        std::cerr << "Server init error: " << e.what() << std::endl;
        return 1;
    }

    {
        // declared first so it outlives the request pool that feeds it
        ThreadPool tunnels(config.tunnelThreads, "tunnel");
        ThreadPool pool(config.workerThreads, "request");

        ConnSettings settings;
        settings.networkTimeout = config.networkTimeout;
        settings.tunnelIdleTimeout = config.tunnelIdleTimeout;

        while (!Server::shutdownRequested()) {
            //basic guarantee
            //If errors are encountered, they will not cause the entire service to crash.
            sockaddr_in clientAddr;
            socklen_t addrSize = sizeof(clientAddr);
            int clientFd = server.acceptConnection(clientAddr, addrSize);
            if (clientFd < 0) {
                continue;
            }

            bool queued = pool.enqueue([clientFd, clientAddr, &agent, &tunnels, settings]() {
                connHandler handler(clientFd, clientAddr, agent, tunnels, settings);
                handler.handleConnection();
            });
            if (!queued) {
                close(clientFd);
            }
        }
    }

    agent.stopMaintenance();
    Logger::getInstance().logMessage(-1, "agent stopped");
    return 0;
}
