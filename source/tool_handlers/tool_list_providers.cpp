#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "automation/providers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_list_providers".
// Static list of the providers reachable through the browser.

namespace tool_list_providers {

class ListProvidersTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["required"] = json::array();

        return {"webpuppet_list_providers", "List available AI providers and their status.", input_schema};
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        (void)arguments;
        (void)context;

        std::string lines;
        for (const auto &provider_info : providers::all_providers()) {
            if (!lines.empty()) {
                lines += "\n";
            }
            lines += std::string("- **") + provider_info.display_name + "** (`" + provider_info.id + "`): [" +
                     provider_info.url + "](" + provider_info.url + ")\n  _" + provider_info.features + "_";
        }

        return mcp_tools::ok(mcp_types::text_result(
            "# Available Providers\n\n" + lines +
            "\n\n*Note: Uses browser sessions; some providers require login.*"));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<ListProvidersTool>());
}

} // namespace tool_list_providers
