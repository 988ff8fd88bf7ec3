#pragma once
#include <string>

#include "result.hpp"

class TCPConnector {
    int sockfd{-1};
    std::string host;
    int port;

public:
    TCPConnector(const std::string& host, int port);
    ~TCPConnector();

    TCPConnector(const TCPConnector&) = delete;
    TCPConnector& operator=(const TCPConnector&) = delete;

    Result open_connection();                 // resolve + blocking connect
    Result send_all(const std::string& data); // every byte or an error
    void close_connection();

    bool is_open() const { return sockfd >= 0; }
    int fd() const { return sockfd; }
};
