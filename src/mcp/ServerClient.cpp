#include "ServerClient.hpp"
#include "McpError.hpp"
#include "core/Version.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_bridge {

namespace {

constexpr int kMaxListPages = 100;

/**
 * @brief Collect every item of a paginated list method
 *
 * Follows nextCursor until it is absent or empty.
 */
std::vector<json> list_paginated(ProtocolSession& session, const std::string& method,
                                 const std::string& key, std::chrono::milliseconds timeout) {
    std::vector<json> items;
    json params = json::object();

    for (int page = 0; page < kMaxListPages; ++page) {
        json result = session.request(method, params, timeout);
        if (!result.is_object() || !result.contains(key) || !result[key].is_array()) {
            throw McpError(ErrorKind::Protocol, method + " result has no '" + key + "' array");
        }
        for (auto& item : result[key]) {
            items.push_back(std::move(item));
        }

        auto cursor = result.find("nextCursor");
        if (cursor == result.end() || !cursor->is_string() || cursor->get<std::string>().empty()) {
            return items;
        }
        params["cursor"] = *cursor;
    }

    spdlog::warn("MCP server '{}': {} stopped after {} pages",
                 session.server_name(), method, kMaxListPages);
    return items;
}

std::vector<ToolDescriptor> parse_tools(const std::string& server, const std::vector<json>& items) {
    std::vector<ToolDescriptor> tools;
    tools.reserve(items.size());

    for (const auto& item : items) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string() ||
            item["name"].get<std::string>().empty()) {
            spdlog::warn("MCP server '{}': skipping tool entry without a name", server);
            continue;
        }
        try {
            tools.push_back(item.get<ToolDescriptor>());
        } catch (const json::exception& e) {
            spdlog::warn("MCP server '{}': skipping tool '{}': {}",
                         server, item["name"].get<std::string>(), e.what());
        }
    }
    return tools;
}

spdlog::level::level_enum log_level_from_mcp(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "info" || level == "notice") return spdlog::level::info;
    if (level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "critical" || level == "alert" || level == "emergency") {
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

} // namespace

std::string_view to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Failed:       return "failed";
    }
    return "unknown";
}

ServerClient::ServerClient(std::string name, TransportFactory factory)
    : name_(std::move(name)), factory_(std::move(factory)) {
    if (name_.empty()) {
        throw std::invalid_argument("Server name cannot be empty");
    }
    if (!factory_) {
        throw std::invalid_argument("Transport factory cannot be null");
    }
}

ServerClient::~ServerClient() {
    disconnect();
}

void ServerClient::connect(const ServerDescriptor& descriptor) {
    std::shared_ptr<ProtocolSession> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.status == ConnectionStatus::Connected ||
            state_.status == ConnectionStatus::Connecting) {
            throw std::logic_error("MCP server '" + name_ + "' is already " +
                                   std::string(to_string(state_.status)));
        }
        state_ = {ConnectionStatus::Connecting, ""};
        descriptor_ = descriptor;
        tools_.clear();
        tools_stale_ = false;
        previous = std::move(session_);
    }
    if (previous) {
        previous->close();
    }

    spdlog::info("Connecting to MCP server '{}' ({})", name_, descriptor.command);

    std::shared_ptr<ProtocolSession> session;
    try {
        auto transport = factory_(descriptor);
        if (!transport) {
            throw McpError::spawn_failed("no transport for server '" + name_ + "'");
        }

        session = std::make_shared<ProtocolSession>(name_, std::move(transport));
        session->set_notification_handler([this](const std::string& method, const json& params) {
            handle_notification(method, params);
        });
        session->set_close_handler([this](const std::string& reason) {
            handle_close(reason);
        });
        session->start();

        InitializeResult init = session->initialize({kBridgeName, kBridgeVersion},
                                                    descriptor.handshake_timeout);

        std::vector<ToolDescriptor> tools;
        if (init.capabilities.tools) {
            try {
                tools = parse_tools(name_, list_paginated(*session, "tools/list", "tools",
                                                          descriptor.request_timeout));
            } catch (const McpError& e) {
                if (e.kind() != ErrorKind::Rpc) {
                    throw;
                }
                spdlog::warn("MCP server '{}': tools/list failed, continuing without tools: {}",
                             name_, e.what());
            }
        } else {
            spdlog::debug("MCP server '{}' does not offer tools", name_);
        }

        const std::size_t tool_count = tools.size();
        bool published = false;
        {
            // handle_close ignores Connecting; a loss after this check finds Connected
            std::lock_guard<std::mutex> lock(mutex_);
            if (session->is_open()) {
                session_ = session;
                server_info_ = init.server_info;
                capabilities_ = init.capabilities;
                tools_ = std::move(tools);
                state_ = {ConnectionStatus::Connected, ""};
                connected_ = true;
                published = true;
            }
        }
        if (!published) {
            throw McpError(ErrorKind::Transport, "MCP server disconnected during handshake");
        }

        spdlog::info("MCP server '{}' connected ({} {}), {} tools",
                     name_, init.server_info.name, init.server_info.version, tool_count);

    } catch (const std::exception& e) {
        if (session) {
            session->close();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = {ConnectionStatus::Failed, e.what()};
            connected_ = false;
        }
        spdlog::warn("MCP server '{}' failed to connect: {}", name_, e.what());
        throw;
    }
}

ConnectionState ServerClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<ToolDescriptor> ServerClient::tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_;
}

ServerInfo ServerClient::server_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

ServerCapabilities ServerClient::capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capabilities_;
}

ServerDescriptor ServerClient::descriptor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return descriptor_;
}

ServerClient::ActiveSession ServerClient::active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != ConnectionStatus::Connected) {
        return {};
    }
    return {session_, descriptor_.request_timeout};
}

template <typename Fn>
auto ServerClient::with_session(Fn&& fn) {
    ActiveSession active = active_session();
    if (!active.session) {
        throw McpError(ErrorKind::Disconnected, "MCP server '" + name_ + "' is disconnected");
    }

    try {
        return fn(*active.session, active.timeout);
    } catch (const McpError& e) {
        if (e.is_connection_fault()) {
            handle_transport_failure(active.session.get(), e.what());
        }
        throw;
    } catch (const json::exception& e) {
        std::string cause = std::string("malformed response: ") + e.what();
        handle_transport_failure(active.session.get(), cause);
        throw McpError(ErrorKind::Protocol, cause);
    }
}

ToolCallResult ServerClient::call_tool(const std::string& remote_name, const json& arguments,
                                       const CancellationToken* cancel) {
    json params = {
        {"name", remote_name},
        {"arguments", arguments.is_null() ? json::object() : arguments}
    };

    return with_session([&](ProtocolSession& session, std::chrono::milliseconds timeout) {
        spdlog::debug("MCP server '{}': calling tool '{}'", name_, remote_name);
        return session.request("tools/call", params, timeout, cancel).get<ToolCallResult>();
    });
}

std::vector<ToolDescriptor> ServerClient::refresh_tools() {
    if (!capabilities().tools) {
        return {};
    }

    auto tools = with_session([this](ProtocolSession& session, std::chrono::milliseconds timeout) {
        return parse_tools(name_, list_paginated(session, "tools/list", "tools", timeout));
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = tools;
    }
    tools_stale_ = false;
    spdlog::info("MCP server '{}': refreshed tool list, {} tools", name_, tools.size());
    return tools;
}

std::vector<ResourceDescriptor> ServerClient::list_resources() {
    return with_session([](ProtocolSession& session, std::chrono::milliseconds timeout) {
        std::vector<ResourceDescriptor> resources;
        for (const auto& item : list_paginated(session, "resources/list", "resources", timeout)) {
            resources.push_back(item.get<ResourceDescriptor>());
        }
        return resources;
    });
}

ResourceReadResult ServerClient::read_resource(const std::string& uri) {
    return with_session([&uri](ProtocolSession& session, std::chrono::milliseconds timeout) {
        return session.request("resources/read", {{"uri", uri}}, timeout).get<ResourceReadResult>();
    });
}

void ServerClient::disconnect() {
    std::shared_ptr<ProtocolSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(session_);
        if (state_.status != ConnectionStatus::Disconnected) {
            state_ = {ConnectionStatus::Disconnected, ""};
        }
        connected_ = false;
    }

    if (session) {
        spdlog::info("Disconnecting MCP server '{}'", name_);
        session->close();
    }
}

void ServerClient::handle_notification(const std::string& method, const json& params) {
    if (method == "notifications/tools/list_changed") {
        tools_stale_ = true;
        spdlog::info("MCP server '{}': tool list changed", name_);
    } else if (method == "notifications/resources/list_changed") {
        spdlog::info("MCP server '{}': resource list changed", name_);
    } else if (method == "notifications/message") {
        const std::string level = params.value("level", "info");
        const json data = params.value("data", json());
        spdlog::log(log_level_from_mcp(level), "MCP server '{}': {}",
                    name_, data.is_string() ? data.get<std::string>() : data.dump());
    } else {
        spdlog::debug("MCP server '{}': ignoring notification '{}'", name_, method);
    }
}

void ServerClient::handle_close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status == ConnectionStatus::Connected) {
        state_ = {ConnectionStatus::Disconnected, "MCP server disconnected: " + reason};
        connected_ = false;
        spdlog::warn("MCP server '{}' is no longer connected: {}", name_, reason);
    }
}

void ServerClient::handle_transport_failure(const ProtocolSession* failed, const std::string& cause) {
    std::shared_ptr<ProtocolSession> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.get() != failed) {
            return;
        }
        dead = std::move(session_);
        if (state_.status == ConnectionStatus::Connected) {
            state_ = {ConnectionStatus::Disconnected, cause};
        }
        connected_ = false;
    }

    spdlog::warn("MCP server '{}': connection lost: {}", name_, cause);
    dead->close();
}

} // namespace mcp_bridge
