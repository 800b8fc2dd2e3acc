#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlmcp {

/// Static description of the tools a server offers. Populated at startup
/// and then shared as std::shared_ptr<const ToolRegistry>.
class ToolRegistry {
public:
    /// Register a tool. Throws std::invalid_argument on a duplicate or empty name.
    void add_tool(ToolDefinition def);

    /// Tools in registration order.
    [[nodiscard]] const std::vector<ToolDefinition>& list_tools() const { return tools_; }

    [[nodiscard]] const ToolDefinition* find(const std::string& name) const;
    [[nodiscard]] bool empty() const { return tools_.empty(); }
    [[nodiscard]] size_t size() const { return tools_.size(); }

    /// Payload shared by the initialize result and the stream capabilities event.
    [[nodiscard]] nlohmann::json handshake(const ServerInfo& info) const;

    /// Check params against the "required" list of a tool's schema.
    /// Returns the first violation, or nullopt when the arguments are acceptable.
    [[nodiscard]] std::optional<std::string> validate_arguments(const std::string& tool,
                                                                const nlohmann::json& params) const;

    /// list_tables, discover_data, prepare_query, query.
    [[nodiscard]] static std::shared_ptr<const ToolRegistry> builtin();

private:
    std::vector<ToolDefinition> tools_;
};

} // namespace sqlmcp
