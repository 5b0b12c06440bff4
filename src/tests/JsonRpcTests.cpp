// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolhost;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 42);
    CHECK(request["method"] == "test/method");
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("test/notify");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "test/notify");
}

TEST_CASE("parseResponse handles success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(result->isSuccess());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseResponse handles error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "error",
          {
              { "code", -32600 },
              { "message", "Invalid Request" },
          } },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(result.has_value());
    CHECK(!result->isSuccess());
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseResponse rejects non-JSON-RPC messages", "[jsonrpc]")
{
    auto msg = nlohmann::json { { "version", "1.0" } };
    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("parseResponse handles response without result or error", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
    };

    auto result = jsonrpc::parseResponse(msg);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ProtocolError);
}

TEST_CASE("makeResult and makeErrorResponse echo the request id", "[jsonrpc]")
{
    auto const id = nlohmann::json("abc");

    auto result = jsonrpc::makeResult(id, nlohmann::json::object());
    CHECK(result["jsonrpc"] == "2.0");
    CHECK(result["id"] == "abc");
    CHECK(result["result"].is_object());

    auto error = jsonrpc::makeErrorResponse(7, jsonrpc::MethodNotFound, "Method not found: sampling/createMessage");
    CHECK(error["id"] == 7);
    CHECK(error["error"]["code"] == -32601);
    CHECK(error["error"]["message"] == "Method not found: sampling/createMessage");
}

TEST_CASE("classify distinguishes responses, notifications and requests", "[jsonrpc]")
{
    auto response = jsonrpc::classify(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 1 }, { "result", 1 } });
    REQUIRE(response.has_value());
    CHECK(*response == jsonrpc::MessageKind::Response);

    auto notification = jsonrpc::classify(jsonrpc::makeNotification("notifications/tools/list_changed"));
    REQUIRE(notification.has_value());
    CHECK(*notification == jsonrpc::MessageKind::Notification);

    auto request = jsonrpc::classify(jsonrpc::makeRequest(3, "ping"));
    REQUIRE(request.has_value());
    CHECK(*request == jsonrpc::MessageKind::Request);
}

TEST_CASE("classify rejects messages that are not JSON-RPC 2.0", "[jsonrpc]")
{
    CHECK(!jsonrpc::classify(nlohmann::json::array()).has_value());
    CHECK(!jsonrpc::classify(nlohmann::json { { "id", 1 }, { "result", 1 } }).has_value());
    CHECK(!jsonrpc::classify(nlohmann::json { { "jsonrpc", "2.0" } }).has_value());
}

TEST_CASE("integerId accepts only integer ids", "[jsonrpc]")
{
    CHECK(jsonrpc::integerId(nlohmann::json(5)) == 5);
    CHECK(!jsonrpc::integerId(nlohmann::json("5")).has_value());
    CHECK(!jsonrpc::integerId(nlohmann::json(nullptr)).has_value());
}
