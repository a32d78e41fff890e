#include "LogCollectorHttpServer.hpp"
#include "TestScratch.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

int main() {
    TestScratch scratch("http-server");

    logcollector::CollectorConfig config;
    config.logRoot = scratch.path().string();
    config.maxOpen = 2;
    config.host = "127.0.0.1";
    config.port = 18600 + static_cast<int>(::getpid() % 1000);

    LogCollectorHttpServer app(config);
    std::atomic<bool> listenFailed{false};
    std::thread serverThread([&] {
        try {
            app.run();
        } catch (const std::exception& e) {
            std::cerr << "HttpServerTests: " << e.what() << std::endl;
            listenFailed = true;
        }
    });
    app.waitUntilReady();
    expect(!listenFailed, "server listening");

    // Keep-alive client delivers a chunk and then idles on its connection.
    httplib::Client keepAlive(config.host, config.port);
    keepAlive.set_keep_alive(true);
    auto delivered = keepAlive.Post("/v1/deliver/x86_64-linux",
                                    R"({"system":"s","identity":"w","attempt_id":"att","line_number":1,"output":"one"})",
                                    "application/json");
    expect(delivered && delivered->status == 200, "delivery accepted");
    auto body = json::parse(delivered->body);
    expect(body["data"]["kind"] == "chunk", "delivery classified");
    expect(body["data"]["actions"] == json::array({"ack"}), "delivery acknowledged");

    // A second client must not wait behind the idle keep-alive connection.
    httplib::Client other(config.host, config.port);
    other.set_read_timeout(2, 0);
    auto health = other.Get("/v1/health");
    expect(health && health->status == 200, "health answered while another client idles");
    expect(json::parse(health->body)["data"]["open_handles"] == 1, "one open handle");

    auto rejected = other.Post("/v1/deliver/x86_64-linux", "not json", "application/json");
    expect(rejected && rejected->status == 400, "undecodable delivery rejected");

    auto escaped = other.Post("/v1/deliver/x86_64-linux",
                              R"({"system":"s","identity":"w","attempt_id":"..","line_number":1,"output":"x"})",
                              "application/json");
    expect(escaped && escaped->status == 422, "traversal rejected");

    auto again = keepAlive.Post("/v1/deliver/x86_64-linux",
                                R"({"system":"s","identity":"w","attempt_id":"att","line_number":3,"output":"three"})",
                                "application/json");
    expect(again && again->status == 200, "keep-alive client reconnects");

    app.stop();
    serverThread.join();

    expect(readFile(scratch.path() / "x86_64-linux/att") == "one\n\nthree\n", "deliveries written in order");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
