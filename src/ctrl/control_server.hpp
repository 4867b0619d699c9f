#pragma once

#include <utility>  // must precede Boost.Asio 1.74 (awaitable.hpp uses std::exchange)
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace idreg {

class IdRegistry;

class ControlServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    ControlServer(boost::asio::io_context& io_context,
                  uint16_t http_port,
                  const std::string& auth_token,
                  std::shared_ptr<IdRegistry> registry);

    ~ControlServer();

    void start();
    void stop();

    // Port actually bound, useful when started on port 0
    uint16_t port() const;

    // Routes one request; exposed for tests
    Response handle_request(const Request& req);

private:
    void accept_connections();
    bool is_authorized(const Request& req) const;

    Response handle_health();
    Response handle_ids_get();
    Response handle_id_by_name(const std::string& name, const std::string& query);
    Response handle_id_by_number(const std::string& number);
    Response handle_ids_post(const std::string& body);
    Response handle_id_delete(const std::string& name);
    Response handle_reinitialize();
    Response handle_metrics();

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t http_port_;
    std::string auth_token_;
    std::shared_ptr<IdRegistry> registry_;

    std::atomic<bool> running_{false};
};

} // namespace idreg
