#include "ProtocolSession.hpp"
#include "McpError.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_bridge {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{50};

// Bound for writes that are not part of a caller's request
constexpr std::chrono::milliseconds kControlWriteTimeout{5000};

std::chrono::steady_clock::time_point control_deadline() {
    return std::chrono::steady_clock::now() + kControlWriteTimeout;
}

} // namespace

ProtocolSession::ProtocolSession(std::string server_name, std::unique_ptr<ITransport> transport)
    : server_name_(std::move(server_name)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
}

ProtocolSession::~ProtocolSession() {
    close();
}

void ProtocolSession::set_notification_handler(NotificationHandler handler) {
    notification_handler_ = std::move(handler);
}

void ProtocolSession::set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
}

void ProtocolSession::start() {
    if (reader_.joinable()) {
        throw std::logic_error("ProtocolSession already started");
    }
    open_ = true;
    reader_ = std::thread(&ProtocolSession::reader_loop, this);
    spdlog::debug("MCP server '{}': session started", server_name_);
}

InitializeResult ProtocolSession::initialize(const ClientInfo& client_info,
                                             std::chrono::milliseconds timeout) {
    json params = {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", client_info}
    };

    json result = request("initialize", params, timeout);

    InitializeResult init;
    try {
        init = result.get<InitializeResult>();
    } catch (const json::exception& e) {
        throw McpError(ErrorKind::Protocol, std::string("malformed initialize result: ") + e.what());
    }

    if (init.protocol_version != kMcpProtocolVersion) {
        // Clients are expected to be lenient here
        spdlog::warn("MCP server '{}' uses protocol version '{}' (we support '{}')",
                     server_name_, init.protocol_version, kMcpProtocolVersion);
    }

    notify("notifications/initialized");
    return init;
}

json ProtocolSession::request(const std::string& method, const json& params,
                              std::chrono::milliseconds timeout,
                              const CancellationToken* cancel) {
    if (!open_) {
        throw McpError::disconnected();
    }

    const long long id = next_id_++;
    std::future<json> response;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        response = pending_[id].get_future();
    }

    // connection_lost() clears the table after flipping open_; re-check so
    // an entry added in between cannot be stranded.
    if (!open_) {
        release(id);
        throw McpError::disconnected();
    }

    // The write counts against the timeout: a server that stops reading
    // its stdin must not hold the caller forever
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        write(make_request(id, method, params), deadline, cancel);
    } catch (const McpError& e) {
        release(id);
        if (e.kind() == ErrorKind::Timeout || e.kind() == ErrorKind::Cancelled) {
            spdlog::warn("MCP server '{}': request {} ({}) not sent: {}",
                         server_name_, id, method, e.what());
        }
        throw;
    }

    while (response.wait_for(kWaitSlice) != std::future_status::ready) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            release(id);
            spdlog::info("MCP server '{}': request {} ({}) cancelled", server_name_, id, method);
            throw McpError(ErrorKind::Cancelled, "MCP request '" + method + "' cancelled");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            release(id);
            spdlog::warn("MCP server '{}': request {} ({}) timed out after {} ms",
                         server_name_, id, method, timeout.count());
            throw McpError::timeout();
        }
    }

    return unwrap_response(response.get());
}

void ProtocolSession::notify(const std::string& method, const json& params) {
    if (!open_) {
        throw McpError::disconnected();
    }
    write(make_notification(method, params), control_deadline());
}

void ProtocolSession::close() {
    std::call_once(close_once_, [this] {
        open_ = false;
        fail_all_pending(ErrorKind::Cancelled, "MCP session with '" + server_name_ + "' closed");
        transport_->close();
        if (reader_.joinable()) {
            reader_.join();
        }
        spdlog::debug("MCP server '{}': session closed", server_name_);
    });
}

std::size_t ProtocolSession::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void ProtocolSession::reader_loop() {
    while (open_) {
        json message;
        try {
            message = transport_->read_message();
        } catch (const McpError& e) {
            if (e.kind() == ErrorKind::Protocol) {
                spdlog::warn("MCP server '{}': {}", server_name_, e.what());
                continue;
            }
            connection_lost(e.what());
            return;
        } catch (const std::exception& e) {
            connection_lost(std::string("read error: ") + e.what());
            return;
        }

        if (message.is_null()) {
            connection_lost("server closed the connection");
            return;
        }

        try {
            dispatch(message);
        } catch (const std::exception& e) {
            spdlog::error("MCP server '{}': error handling message: {}", server_name_, e.what());
        }
    }
}

void ProtocolSession::dispatch(const json& message) {
    if (spdlog::should_log(spdlog::level::trace)) {
        spdlog::trace("MCP server '{}' -> {}", server_name_, message.dump());
    }

    switch (classify_message(message)) {
        case MessageType::Response:
            handle_response(message);
            break;
        case MessageType::Notification:
            if (notification_handler_) {
                notification_handler_(message["method"].get<std::string>(),
                                      message.contains("params") ? message["params"] : json::object());
            }
            break;
        case MessageType::Request:
            handle_server_request(message);
            break;
        case MessageType::Invalid:
            spdlog::warn("MCP server '{}': ignoring invalid message: {}",
                         server_name_, message.dump());
            break;
    }
}

void ProtocolSession::handle_response(const json& message) {
    const json& id = message["id"];
    if (!id.is_number_integer()) {
        spdlog::warn("MCP server '{}': response with unexpected id {}", server_name_, id.dump());
        return;
    }

    std::promise<json> promise;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id.get<long long>());
        if (it == pending_.end()) {
            spdlog::debug("MCP server '{}': response for unknown or abandoned request {}",
                          server_name_, id.dump());
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise.set_value(message);
}

void ProtocolSession::handle_server_request(const json& message) {
    const std::string method = message["method"].get<std::string>();
    const json& id = message["id"];

    if (method == "ping") {
        write(make_response(id, json::object()), control_deadline());
        return;
    }

    spdlog::debug("MCP server '{}': unsupported server request '{}'", server_name_, method);
    write(make_error_response(id, rpc_error::METHOD_NOT_FOUND, "Method not found: " + method),
          control_deadline());
}

void ProtocolSession::connection_lost(const std::string& reason) {
    if (!open_.exchange(false)) {
        return;
    }
    spdlog::info("MCP server '{}' disconnected ({})", server_name_, reason);
    fail_all_pending(ErrorKind::Transport, "MCP server disconnected: " + reason);
    if (close_handler_) {
        close_handler_(reason);
    }
}

void ProtocolSession::fail_all_pending(ErrorKind kind, const std::string& reason) {
    std::map<long long, std::promise<json>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [id, promise] : pending) {
        promise.set_exception(std::make_exception_ptr(McpError(kind, reason)));
    }
}

void ProtocolSession::release(long long id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(id);
}

void ProtocolSession::write(const json& message, std::chrono::steady_clock::time_point deadline,
                            const CancellationToken* cancel) {
    if (spdlog::should_log(spdlog::level::trace)) {
        spdlog::trace("MCP server '{}' <- {}", server_name_, message.dump());
    }
    transport_->write_message_until(message, deadline, cancel);
}

} // namespace mcp_bridge
