#include "LogCollectorHttpServer.hpp"

#include <iostream>
#include <stdexcept>
#include "logcollector/Errors.hpp"

using json = nlohmann::json;

LogCollectorHttpServer::LogCollectorHttpServer(const logcollector::CollectorConfig& config)
    : host_(config.host), port_(config.port), collector_(config) {
    // A single worker keeps dispatch sequential and in arrival order.
    server_.new_task_queue = [] { return new httplib::ThreadPool(1); };
    // One request per connection, or an idle keep-alive client would hold
    // the only worker until its timeout.
    server_.set_keep_alive_max_count(1);
    setupRoutes();
}

void LogCollectorHttpServer::run() {
    std::cout << "LogCollector HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

void LogCollectorHttpServer::stop() {
    server_.stop();
}

void LogCollectorHttpServer::waitUntilReady() const {
    server_.wait_until_ready();
}

void LogCollectorHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    auto dumpSafe = [](const json& j) {
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors, dumpSafe](const httplib::Request&, httplib::Response& res) {
        json data = {
            {"root", collector_.logRoot().string()},
            {"max_open", collector_.maxOpen()},
            {"open_handles", collector_.openHandles()}
        };
        res.set_content(dumpSafe(ok(data)), "application/json");
        addCors(res);
    });

    // --- DELIVER ---
    // Everything after /v1/deliver/ is the routing key, slashes included.
    server_.Post(R"(/v1/deliver/(.+))", [this, ok, err, addCors, dumpSafe](const httplib::Request& req, httplib::Response& res) {
        std::string routingKey = req.matches[1];
        try {
            auto message = collector_.classify(routingKey, req.body);
            auto actions = collector_.consume(message);

            json names = json::array();
            for (auto action : actions) names.push_back(logcollector::actionName(action));
            json data = {
                {"routing_key", message.from.routingKey},
                {"attempt_id", message.from.attemptId},
                {"kind", logcollector::kindName(message.event)},
                {"actions", names}
            };
            res.set_content(dumpSafe(ok(data)), "application/json");
        }
        catch (const logcollector::DecodeError& e) {
            res.status = 400;
            res.set_content(dumpSafe(err(400, e.what())), "application/json");
        }
        catch (const logcollector::PathValidationError& e) {
            std::cerr << "LogCollectorHttpServer: rejected delivery: " << e.what() << "\n";
            res.status = 422;
            res.set_content(dumpSafe(err(422, e.what())), "application/json");
        }
        catch (const std::exception& e) {
            std::cerr << "LogCollectorHttpServer: delivery failed: " << e.what() << "\n";
            res.status = 500;
            res.set_content(dumpSafe(err(500, e.what())), "application/json");
        }
        addCors(res);
    });
}
