#include "control_server.hpp"
#include "../common/metrics.hpp"
#include "../registry/errors.hpp"
#include "../registry/id_registry.hpp"
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <optional>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace idreg {

namespace {

std::optional<std::string> percent_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(text.data() + i + 1, text.data() + i + 3, value, 16);
        if (ec != std::errc() || ptr != text.data() + i + 3) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(value));
        i += 2;
    }
    return out;
}

// Decoded value of `key` in a query string, nullopt when absent
std::optional<std::string> query_param(std::string_view query, std::string_view key) {
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        size_t eq = pair.find('=');
        if (pair.substr(0, eq) == key) {
            return percent_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) {
            break;
        }
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

ControlServer::Response json_response(http::status status, const nlohmann::json& body) {
    ControlServer::Response res;
    res.result(status);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump(2);
    return res;
}

ControlServer::Response error_response(http::status status, const std::string& message) {
    return json_response(status, nlohmann::json{{"error", message}});
}

nlohmann::json owner_json(const std::optional<Owner>& owner) {
    return owner ? nlohmann::json(owner->id) : nlohmann::json(nullptr);
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, ControlServer& server)
        : stream_(std::move(socket)), server_(server) {}

    void run() {
        do_read();
    }

private:
    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));

        http::async_read(stream_, buffer_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) {
            close();
            return;
        }
        if (ec) {
            spdlog::debug("Control read error: {}", ec.message());
            return;
        }

        auto res = std::make_shared<ControlServer::Response>(server_.handle_request(req_));
        http::async_write(stream_, *res,
            [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                if (ec) {
                    spdlog::debug("Control write error: {}", ec.message());
                    return;
                }
                if (res->need_eof()) {
                    self->close();
                    return;
                }
                self->do_read();
            });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    ControlServer::Request req_;
    ControlServer& server_;
};

} // namespace

ControlServer::ControlServer(boost::asio::io_context& io_context,
                             uint16_t http_port,
                             const std::string& auth_token,
                             std::shared_ptr<IdRegistry> registry)
    : io_context_(io_context), acceptor_(io_context), http_port_(http_port),
      auth_token_(auth_token), registry_(std::move(registry)) {
}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start() {
    if (running_.exchange(true)) {
        return;
    }

    tcp::endpoint endpoint(tcp::v4(), http_port_);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    accept_connections();

    spdlog::info("ControlServer started on HTTP port {}", port());
}

void ControlServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    beast::error_code ec;
    acceptor_.close(ec);

    spdlog::info("ControlServer stopped");
}

uint16_t ControlServer::port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? http_port_ : endpoint.port();
}

void ControlServer::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (running_.load()) {
                    spdlog::error("Control accept error: {}", ec.message());
                }
                return;
            }

            std::make_shared<HttpSession>(std::move(socket), *this)->run();

            if (running_.load()) {
                accept_connections();
            }
        });
}

bool ControlServer::is_authorized(const Request& req) const {
    auto header = req[http::field::authorization];
    return std::string(header.data(), header.size()) == "Bearer " + auth_token_;
}

ControlServer::Response ControlServer::handle_request(const Request& req) {
    Response res;

    try {
        std::string target(req.target().data(), req.target().size());
        std::string path = target.substr(0, target.find('?'));
        std::string query = path.size() < target.size() ? target.substr(path.size() + 1) : "";
        auto method = req.method();

        bool mutating = method == http::verb::post || method == http::verb::delete_;
        if (mutating && !is_authorized(req)) {
            res = error_response(http::status::unauthorized, "Unauthorized");
        } else if (path == "/health" && method == http::verb::get) {
            res = handle_health();
        } else if (path == "/ids" && method == http::verb::get) {
            res = handle_ids_get();
        } else if (path == "/ids" && method == http::verb::post) {
            res = handle_ids_post(req.body());
        } else if (path.starts_with("/ids/by-id/") && method == http::verb::get) {
            res = handle_id_by_number(path.substr(std::string("/ids/by-id/").size()));
        } else if (path.starts_with("/ids/") && path.size() > 5 &&
                   (method == http::verb::get || method == http::verb::delete_)) {
            auto name = percent_decode(std::string_view(path).substr(5));
            if (!name) {
                res = error_response(http::status::bad_request, "Malformed name encoding");
            } else if (method == http::verb::get) {
                res = handle_id_by_name(*name, query);
            } else {
                res = handle_id_delete(*name);
            }
        } else if (path == "/admin/reinitialize" && method == http::verb::post) {
            res = handle_reinitialize();
        } else if (path == "/metrics" && method == http::verb::get) {
            res = handle_metrics();
        } else {
            res = error_response(http::status::not_found, "Not Found");
        }

    } catch (const OwnershipConflict& e) {
        nlohmann::json body;
        body["error"] = e.what();
        body["requested_owner"] = owner_json(e.requested_owner());
        body["actual_owner"] = owner_json(e.actual_owner());
        body["registered_at_ms"] = to_epoch_ms(e.original_context().registered_at);
        res = json_response(http::status::conflict, body);
    } catch (const DuplicateRegistration& e) {
        res = error_response(http::status::conflict, e.what());
    } catch (const InvariantViolation& e) {
        res = error_response(http::status::conflict, e.what());
    } catch (const InvalidName& e) {
        res = error_response(http::status::bad_request, e.what());
    } catch (const CapacityExceeded& e) {
        res = error_response(http::status::insufficient_storage, e.what());
    } catch (const nlohmann::json::exception& e) {
        res = error_response(http::status::bad_request, e.what());
    } catch (const std::exception& e) {
        res = error_response(http::status::internal_server_error, e.what());
        spdlog::error("HTTP request error: {}", e.what());
    }

    res.version(req.version());
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

ControlServer::Response ControlServer::handle_health() {
    nlohmann::json health;
    health["status"] = "ok";
    health["live_ids"] = registry_->live_count();
    health["persisted_ids"] = registry_->persisted_count();
    health["max_ids"] = registry_->max_ids();
    health["store"] = registry_->store().path().string();
    return json_response(http::status::ok, health);
}

ControlServer::Response ControlServer::handle_ids_get() {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& entry : registry_->snapshot()) {
        ids.push_back({
            {"id", entry.id},
            {"name", entry.name},
            {"owner", owner_json(entry.owner)},
            {"registered_at_ms", to_epoch_ms(entry.registered_at)}
        });
    }

    nlohmann::json response;
    response["ids"] = ids;
    response["count"] = ids.size();
    response["dump"] = registry_->dump();
    return json_response(http::status::ok, response);
}

ControlServer::Response ControlServer::handle_id_by_name(const std::string& name, const std::string& query) {
    IndexIdPtr handle;

    // An empty owner parameter asks for the no-owner sentinel
    auto owner = query_param(query, "owner");
    if (owner) {
        std::optional<Owner> required;
        if (!owner->empty()) {
            required = Owner{*owner};
        }
        handle = registry_->find_by_name(name, required);
    } else {
        handle = registry_->find_by_name(name);
    }

    if (!handle) {
        return error_response(http::status::not_found, "No live id named '" + name + "'");
    }

    auto context = registry_->registration_context(handle);
    return json_response(http::status::ok, {
        {"id", handle->unique_id()},
        {"name", handle->name()},
        {"owner", owner_json(context ? context->owner : std::nullopt)}
    });
}

ControlServer::Response ControlServer::handle_id_by_number(const std::string& number) {
    int id = 0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), id);
    if (ec != std::errc() || ptr != number.data() + number.size()) {
        return error_response(http::status::bad_request, "Malformed id '" + number + "'");
    }

    IndexIdPtr handle = registry_->find_by_id(id);
    if (!handle) {
        return error_response(http::status::not_found, "No live id " + number);
    }
    return json_response(http::status::ok, {{"id", handle->unique_id()}, {"name", handle->name()}});
}

ControlServer::Response ControlServer::handle_ids_post(const std::string& body) {
    auto json = nlohmann::json::parse(body);
    std::string name = json.at("name").get<std::string>();

    std::optional<Owner> owner;
    if (json.contains("owner") && !json["owner"].is_null()) {
        owner = Owner{json["owner"].get<std::string>()};
    }

    IndexIdPtr handle = registry_->register_name(name, owner);
    return json_response(http::status::ok, {{"id", handle->unique_id()}, {"name", handle->name()}});
}

ControlServer::Response ControlServer::handle_id_delete(const std::string& name) {
    IndexIdPtr handle = registry_->find_by_name(name);
    if (!handle) {
        return error_response(http::status::not_found, "No live id named '" + name + "'");
    }

    registry_->unregister(handle);
    return json_response(http::status::ok, {{"status", "unregistered"}, {"id", handle->unique_id()}});
}

ControlServer::Response ControlServer::handle_reinitialize() {
    registry_->reinitialize_disk_storage();
    return json_response(http::status::ok, {
        {"status", "reinitialized"},
        {"persisted_ids", registry_->persisted_count()}
    });
}

ControlServer::Response ControlServer::handle_metrics() {
    Response res;
    res.result(http::status::ok);
    res.set(http::field::content_type, "text/plain");
    res.body() = MetricsCollector::instance().prometheus_text();
    return res;
}

} // namespace idreg
