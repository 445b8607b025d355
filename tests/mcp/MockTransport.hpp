#pragma once

#include "mcp/ITransport.hpp"
#include "mcp/TransportFactory.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_bridge {

/**
 * @brief In-memory transport for protocol and client tests
 *
 * Inbound messages are queued by the test (or by a responder reacting to
 * outbound messages); read_message() blocks until one is available, the
 * input is finished, or the transport is closed.
 */
class MockTransport : public ITransport {
public:
    /**
     * @brief Reaction to an outbound message
     * @return Messages to queue as inbound
     */
    using Responder = std::function<std::vector<json>(const json& message, MockTransport& transport)>;

    MockTransport() = default;

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;
    void close() override;

    /**
     * @brief Queue an inbound message
     */
    void push_message(const json& message);

    /**
     * @brief Queue an inbound line that is not valid JSON
     */
    void push_malformed(const std::string& line);

    /**
     * @brief Signal EOF once the queued messages are consumed
     */
    void finish();

    void set_responder(Responder responder);

    /**
     * @brief Make every following write fail with a Transport error
     */
    void fail_writes(bool fail);

    /**
     * @brief All messages written so far
     */
    std::vector<json> written() const;

    /**
     * @brief Wait until at least count messages were written
     * @return false on timeout
     */
    bool wait_for_writes(std::size_t count, std::chrono::milliseconds timeout);

    bool closed() const;

private:
    struct Inbound {
        json message;
        std::string malformed;
        bool is_malformed = false;
    };

    mutable std::mutex mutex_;
    std::condition_variable inbox_cv_;
    std::condition_variable written_cv_;
    std::deque<Inbound> inbox_;
    std::vector<json> written_;
    Responder responder_;
    bool finished_ = false;
    bool closed_ = false;
    bool fail_writes_ = false;
};

/**
 * @brief Factory handing out transports that forward to one shared mock
 *
 * The test keeps the mock alive after the client has dropped its
 * transport, so it can check what was (not) written.
 */
TransportFactory mock_transport_factory(std::shared_ptr<MockTransport> mock);

/**
 * @brief Responder emulating a well-behaved MCP server
 *
 * Answers initialize, tools/list (with the given tools), ping and
 * resources/list. tools/call is answered with call_handler's result; a
 * null result sends no answer. Without a handler, tools/call echoes its
 * arguments as text.
 */
MockTransport::Responder scripted_mcp_server(
    json tools,
    std::function<json(const json& params, MockTransport& transport)> call_handler = nullptr,
    json capabilities = {{"tools", json::object()}});

} // namespace mcp_bridge
