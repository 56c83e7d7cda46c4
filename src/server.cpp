//server.cpp
#include "server.hpp"
#include "logger.hpp"

#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <memory>

volatile std::sig_atomic_t Server::shutdownFlag = 0;

static const int LISTEN_BACKLOG = 64;

//no throw
Server::Server(int port) : port(port), serverFd(-1){}


Server::~Server() {
    if(serverFd != -1){
        closeServer(serverFd);
    }
}

// Socket bound and listening on addr, or -1
static int openListener(const struct addrinfo *addr){
    int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if(fd < 0){
        return -1;
    }
    int opt = 1;
    if(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0
       || bind(fd, addr->ai_addr, addr->ai_addrlen) < 0
       || listen(fd, LISTEN_BACKLOG) < 0){
        Logger::getInstance().logWarning(-1, std::string("listener setup failed: ") + strerror(errno));
        close(fd);
        return -1;
    }
    return fd;
}

//basic guarantee
//Nothing is left open when init throws.
void Server::init(){
    struct addrinfo hints;
    memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    struct addrinfo *found = nullptr;
    int status = getaddrinfo(nullptr, std::to_string(port).c_str(), &hints, &found);
    if(status != 0){
        throw std::runtime_error(std::string("getaddrinfo error: ") + gai_strerror(status));
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> candidates(found, &freeaddrinfo);

    for(const struct addrinfo *p = candidates.get(); p != nullptr && serverFd < 0; p = p->ai_next){
        serverFd = openListener(p);
    }
    if(serverFd < 0){
        throw std::runtime_error("Failed to bind port " + std::to_string(port));
    }

    // port 0 asks the kernel for an ephemeral port
    if(port == 0){
        struct sockaddr_in bound;
        socklen_t len = sizeof(bound);
        if(getsockname(serverFd, (struct sockaddr *)&bound, &len) != 0){
            closeServer(serverFd);
            serverFd = -1;
            throw std::runtime_error("getsockname error");
        }
        port = ntohs(bound.sin_port);
    }
}


//basic guarantee
//A failed accept is reported and the caller keeps serving.
int Server::acceptConnection(struct sockaddr_in &clientAddr, socklen_t &clientAddrSize){
    int clientFd = accept(serverFd, (struct sockaddr *)&clientAddr, &clientAddrSize);
    if(clientFd < 0){
        if(errno != EINTR){
            Logger::getInstance().logError(-1, std::string("accept error: ") + strerror(errno));
        }
        return -1;
    }
    return clientFd;
}

void Server::setUpSignalHandler(){
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = Server::signalHandler;
    // no SA_RESTART: accept() must return so the main loop sees the flag
    sa.sa_flags = 0;
    sigemptyset(&sa.sa_mask);
    if(sigaction(SIGINT, &sa, nullptr) < 0){
        throw std::runtime_error("SIGINT handler error");
    }
    if(sigaction(SIGTERM, &sa, nullptr) < 0){
        throw std::runtime_error("SIGTERM handler error");
    }
    // a client closing mid-response must not kill the process
    signal(SIGPIPE, SIG_IGN);
}

bool Server::shutdownRequested(){
    return shutdownFlag != 0;
}

void Server::signalHandler(int signum){
    const char *msg;
    switch(signum){
        case SIGINT:
            msg = "Caught Ctrl+C, shutting down gracefully...\n";
            break;
        case SIGTERM:
            msg = "Caught kill command, shutting down...\n";
            break;
        default:
            msg = "Unknown signal, shutting down...\n";
            break;
    }
    ssize_t ignored = write(STDOUT_FILENO, msg, strlen(msg));
    (void)ignored;
    shutdownFlag = 1;
}


//basic guarantee
void Server::closeServer(int fd){
    if(close(fd) < 0){
        Logger::getInstance().logError(-1, std::string("close error: ") + strerror(errno));
    }
}
