#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

namespace swarmget::testing {

/**
 * @brief HTTP tracker on 127.0.0.1 answering every announce with one fixed
 * bencoded body
 */
class HttpTracker
{
 public:
    explicit HttpTracker(std::string response_body);
    ~HttpTracker();

    HttpTracker(const HttpTracker&) = delete;
    HttpTracker& operator=(const HttpTracker&) = delete;

    auto announce_url() const -> std::string;

    // Request targets (path and query) in arrival order
    auto requests() const -> std::vector<std::string>;

 private:
    class Session;

    void _accept();
    void _record(std::string target);

    const std::string _body;

    asio::io_context _io;
    asio::ip::tcp::acceptor _acceptor;
    std::thread _thread;

    mutable std::mutex _mutex;
    std::vector<std::string> _requests;
};

}  // namespace swarmget::testing
