//
// Created by gregorian-rayne on 10/13/26.
//

#include <gtest/gtest.h>
#include "server.hpp"
#include "ars/rules/all_rules.hpp"
#include "ars/scanner/scanner.hpp"
#include "ars/service/scan_api.hpp"
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <memory>
#include <string>

using namespace ars;
using json = nlohmann::json;

namespace {

    struct RawResponse {
        int status = 0;
        std::string body;
    };

    /**
     * Sends one raw HTTP request and reads until the server closes.
     */
    RawResponse send_request(const int port, const std::string& request) {
        RawResponse response;

        const int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            return response;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

        if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            close(fd);
            return response;
        }

        std::size_t sent = 0;
        while (sent < request.size()) {
            const ssize_t n = send(fd, request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) break;
            sent += static_cast<std::size_t>(n);
        }

        std::string raw;
        char chunk[4096];
        ssize_t n;
        while ((n = recv(fd, chunk, sizeof(chunk), 0)) > 0) {
            raw.append(chunk, static_cast<std::size_t>(n));
        }
        close(fd);

        if (raw.rfind("HTTP/1.1 ", 0) == 0 && raw.size() >= 12) {
            response.status = std::stoi(raw.substr(9, 3));
        }
        if (const auto split = raw.find("\r\n\r\n"); split != std::string::npos) {
            response.body = raw.substr(split + 4);
        }
        return response;
    }

    std::string post(const std::string& path, const std::string& body) {
        return "POST " + path + " HTTP/1.1\r\n"
               "Host: localhost\r\n"
               "Content-Type: application/json\r\n"
               "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    }

}  // namespace

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config::ServerConfig options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.threads = 2;
        options.max_request_size = 4096;

        server = std::make_unique<service::Server>(options, api);
        const auto started = server->start_async();
        ASSERT_TRUE(started.is_ok()) << started.error();
        ASSERT_NE(server->port(), 0);
    }

    void TearDown() override {
        if (server) {
            server->stop();
        }
    }

    rules::RuleSet rule_set = rules::default_rule_set();
    scanner::Scanner scanner{rule_set};
    service::ScanApi api{scanner};
    std::unique_ptr<service::Server> server;
};

TEST_F(ServerTest, HealthOverHttp) {
    const auto response = send_request(server->port(), "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");

    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(json::parse(response.body)["rules"], json::array({303, 304}));
}

TEST_F(ServerTest, RemediateOverHttp) {
    const json unit = {
        {"pgm_name", "ZPROG"}, {"inc_name", "ZPROG"}, {"type", "REPORT"},
        {"start_line", 100}, {"end_line", 102},
        {"code", "DATA: lv_x TYPE i.\nBREAK-POINT.\n"}
    };

    const auto response = send_request(server->port(), post("/remediate", unit.dump()));

    ASSERT_EQ(response.status, 200);
    const auto body = json::parse(response.body);
    ASSERT_EQ(body["findings"].size(), 1u);
    EXPECT_EQ(body["findings"][0]["starting_line"], 102);
}

TEST_F(ServerTest, OversizedBodyIsRejected) {
    const auto response = send_request(server->port(),
        "POST /remediate HTTP/1.1\r\nHost: localhost\r\nContent-Length: 8192\r\n\r\n");

    EXPECT_EQ(response.status, 413);
}

TEST_F(ServerTest, OptionsPreflight) {
    const auto response = send_request(server->port(), "OPTIONS /remediate HTTP/1.1\r\nHost: localhost\r\n\r\n");
    EXPECT_EQ(response.status, 204);
}

TEST_F(ServerTest, InvalidPayloadIsUnprocessable) {
    const auto response = send_request(server->port(), post("/remediate-array", R"([{"pgm_name": 1}])"));

    ASSERT_EQ(response.status, 422);
    EXPECT_EQ(json::parse(response.body)["detail"], "[0].pgm_name");
}

TEST_F(ServerTest, StopEndsServing) {
    EXPECT_TRUE(server->is_running());
    server->stop();
    EXPECT_FALSE(server->is_running());
}
