#include "tests/http_tracker.hpp"

#include <memory>
#include <utility>

#include <fmt/core.h>

namespace swarmget::testing {

class HttpTracker::Session : public std::enable_shared_from_this<Session>
{
 public:
    Session(HttpTracker& tracker, asio::ip::tcp::socket socket) :
      _tracker(tracker), _socket(std::move(socket))
    {
    }

    void start()
    {
        asio::async_read_until(
          _socket, asio::dynamic_buffer(_request), "\r\n\r\n",
          [self = shared_from_this()](const asio::error_code& error, std::size_t) {
              if (not error) {
                  self->_respond();
              }
          }
        );
    }

 private:
    void _respond()
    {
        // "GET <target> HTTP/1.1"
        const auto line = _request.substr(0, _request.find("\r\n"));
        const auto begin = line.find(' ');
        const auto end = line.rfind(' ');
        if (begin != std::string::npos and end > begin) {
            _tracker._record(line.substr(begin + 1, end - begin - 1));
        }

        _response = fmt::format(
          "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n"
          "Content-Length: {}\r\nConnection: close\r\n\r\n{}",
          _tracker._body.size(), _tracker._body
        );

        asio::async_write(
          _socket, asio::buffer(_response),
          [self = shared_from_this()](const asio::error_code&, std::size_t) {
              asio::error_code ignored;
              self->_socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
          }
        );
    }

    HttpTracker& _tracker;
    asio::ip::tcp::socket _socket;
    std::string _request;
    std::string _response;
};

HttpTracker::HttpTracker(std::string response_body) :
  _body(std::move(response_body)),
  _acceptor(_io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
{
    _accept();
    _thread = std::thread([this] { _io.run(); });
}

HttpTracker::~HttpTracker()
{
    _io.stop();
    _thread.join();
}

auto HttpTracker::announce_url() const -> std::string
{
    return fmt::format(
      "http://127.0.0.1:{}/announce", _acceptor.local_endpoint().port()
    );
}

auto HttpTracker::requests() const -> std::vector<std::string>
{
    std::scoped_lock lock(_mutex);
    return _requests;
}

void HttpTracker::_record(std::string target)
{
    std::scoped_lock lock(_mutex);
    _requests.push_back(std::move(target));
}

void HttpTracker::_accept()
{
    _acceptor.async_accept([this](const asio::error_code& error, asio::ip::tcp::socket socket) {
        if (error) {
            return;
        }

        std::make_shared<Session>(*this, std::move(socket))->start();
        _accept();
    });
}

}  // namespace swarmget::testing
