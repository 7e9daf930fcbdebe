#include "receptionist/transport/media_server.hpp"

#include <algorithm>
#include <stdexcept>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "receptionist/logging.hpp"
#include "receptionist/utils/http.hpp"

namespace receptionist::transport {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;

class WsMediaSocket : public MediaSocket {
public:
    WsMediaSocket(WsServer& server, websocketpp::connection_hdl connection)
        : server_(server), connection_(std::move(connection)) {}

    bool send_text(const std::string& payload) override {
        if (closed_) {
            // Frames racing a local close are dropped.
            return true;
        }
        websocketpp::lib::error_code ec;
        server_.send(connection_, payload, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logging::debug(
                "Media socket send failed",
                {kv("error", ec.message())});
            return false;
        }
        return true;
    }

    void close(const std::string& reason) override {
        close_with(websocketpp::close::status::normal, reason);
    }

    void reject(const std::string& reason) override {
        close_with(websocketpp::close::status::policy_violation, reason);
    }

private:
    void close_with(websocketpp::close::status::value code, const std::string& reason) {
        if (closed_.exchange(true)) {
            return;
        }
        websocketpp::lib::error_code ec;
        server_.close(connection_, code, reason, ec);
        if (ec) {
            logging::debug(
                "Media socket close failed",
                {kv("error", ec.message())});
        }
    }

    WsServer& server_;
    websocketpp::connection_hdl connection_;
    std::atomic<bool> closed_{false};
};

}

struct MediaServer::Impl {
    WsServer server;
    mutable std::mutex mutex;
    std::map<websocketpp::connection_hdl,
             std::shared_ptr<MediaSession>,
             std::owner_less<websocketpp::connection_hdl>> sessions;

    std::shared_ptr<MediaSession> find(const websocketpp::connection_hdl& hdl) const {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(hdl);
        return it == sessions.end() ? nullptr : it->second;
    }

    std::shared_ptr<MediaSession> take(const websocketpp::connection_hdl& hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = sessions.find(hdl);
        if (it == sessions.end()) {
            return nullptr;
        }
        auto session = it->second;
        sessions.erase(it);
        return session;
    }
};

MediaServer::MediaServer(int port,
                         int threads,
                         std::string path,
                         std::shared_ptr<session::SessionParameterCache> sessions,
                         MediaSession::CallFactory factory)
    : port_(port),
      threads_(std::max(1, threads)),
      path_(std::move(path)),
      sessions_(std::move(sessions)),
      factory_(std::move(factory)),
      impl_(std::make_unique<Impl>()) {}

MediaServer::~MediaServer() {
    stop();
}

void MediaServer::start() {
    if (running_.exchange(true)) {
        return;
    }
    auto& server = impl_->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = impl_->server.get_con_from_hdl(hdl);
        const auto& resource = connection->get_resource();
        const auto path = resource.substr(0, resource.find('?'));
        if (path != path_) {
            logging::warn(
                "Rejecting media socket on unknown path",
                {kv("path", path)});
            connection->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        return true;
    });

    server.set_open_handler([this](websocketpp::connection_hdl hdl) {
        auto connection = impl_->server.get_con_from_hdl(hdl);
        const auto query = utils::parse_query(connection->get_resource());
        const auto it = query.find("callSid");
        auto socket = std::make_shared<WsMediaSocket>(impl_->server, hdl);
        auto session = std::make_shared<MediaSession>(
            socket, sessions_, factory_, it == query.end() ? "" : it->second);
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->sessions[hdl] = session;
        }
        logging::debug(
            "Media socket opened",
            {kv("remote", connection->get_remote_endpoint())});
    });

    server.set_message_handler([this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        if (auto session = impl_->find(hdl)) {
            session->handle_text(msg->get_payload());
        }
    });

    auto on_gone = [this](websocketpp::connection_hdl hdl) {
        if (auto session = impl_->take(hdl)) {
            session->close();
        }
    };
    server.set_close_handler(on_gone);
    server.set_fail_handler(on_gone);

    websocketpp::lib::error_code ec;
    server.listen(static_cast<uint16_t>(port_), ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Media server failed to listen on port " +
                                 std::to_string(port_) + ": " + ec.message());
    }
    server.start_accept(ec);
    if (ec) {
        running_ = false;
        throw std::runtime_error("Media server failed to accept: " + ec.message());
    }

    for (int i = 0; i < threads_; ++i) {
        workers_.emplace_back([this]() {
            try {
                impl_->server.run();
            } catch (const std::exception& ex) {
                logging::error(
                    "Media server worker stopped",
                    {kv("error", ex.what())});
            }
        });
    }
    logging::info(
        "Media server listening",
        {kv("port", port_),
         kv("path", path_),
         kv("threads", threads_)});
}

void MediaServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    auto& server = impl_->server;
    websocketpp::lib::error_code ec;
    server.stop_listening(ec);

    std::map<websocketpp::connection_hdl,
             std::shared_ptr<MediaSession>,
             std::owner_less<websocketpp::connection_hdl>> sessions;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        sessions.swap(impl_->sessions);
    }
    for (auto& item : sessions) {
        item.second->close();
        server.close(item.first, websocketpp::close::status::going_away, "shutdown", ec);
    }
    server.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    logging::info("Media server stopped");
}

size_t MediaServer::active_sessions() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->sessions.size();
}

}
