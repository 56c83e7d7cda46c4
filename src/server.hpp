// src/server.hpp

#ifndef SERVER_HPP
#define SERVER_HPP
#include <netinet/in.h>
#include <arpa/inet.h>
#include <csignal>

class Server{
    private:
        int port;
        int serverFd;
        static volatile std::sig_atomic_t shutdownFlag;

        void closeServer(int fd);
        static void signalHandler(int signum);

    public:
        explicit Server(int port);
        ~Server();

        Server(const Server&) = delete;
        Server& operator=(const Server&) = delete;

        int get_port() const {
            return port;
        }

        int get_serverFd() const {
            return serverFd;
        }

        // throws std::runtime_error when the listening socket cannot be set up
        void init();

        // -1 on failure or when interrupted by a shutdown signal
        int acceptConnection(sockaddr_in &clientAddr, socklen_t &clientAddrSize);

        static void setUpSignalHandler();
        static bool shutdownRequested();
};

#endif
