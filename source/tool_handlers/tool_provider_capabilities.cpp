#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "automation/providers.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool "webpuppet_provider_capabilities".
// Declared capabilities of one provider, as pretty-printed JSON text.

namespace tool_provider_capabilities {

class ProviderCapabilitiesTool : public mcp_tools::Tool {
public:
    mcp_types::ToolDefinition definition() const override {
        json input_schema;
        input_schema["type"] = "object";
        input_schema["properties"] = json::object();
        input_schema["properties"]["provider"] = {
            {"type", "string"},
            {"enum", providers::provider_ids()},
            {"description", "Provider/tool to inspect"}
        };
        input_schema["required"] = json::array({"provider"});

        return {
            "webpuppet_provider_capabilities",
            "Get declared capabilities for a provider/tool (conversation, vision, file upload, web search, etc).",
            input_schema
        };
    }

    mcp_tools::ToolOutcome execute(const json &arguments, mcp_tools::ToolContext &context) override {
        std::string denial_reason;
        if (!context.gate().require(permission_gate::Operation::ReadContent, denial_reason)) {
            return mcp_tools::fail(mcp_error::ErrorKind::PermissionDenied, denial_reason);
        }

        std::string provider_name;
        std::string argument_error;
        if (!mcp_tools::require_string_argument(arguments, "provider", provider_name, argument_error)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, argument_error);
        }

        providers::Provider provider;
        if (!providers::parse_provider(provider_name, provider)) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams, "unknown provider: " + provider_name);
        }

        // Capabilities are declared statically; a live handle answers when
        // there is one, otherwise no browser is started just for this.
        std::optional<providers::Capabilities> declared;
        std::shared_ptr<automation::AutomationHandle> handle = context.current_automation();
        if (handle) {
            declared = handle->provider_capabilities(provider);
        } else {
            declared = providers::capabilities(provider);
        }
        if (!declared) {
            return mcp_tools::fail(mcp_error::ErrorKind::InvalidParams,
                                   "provider not available: " + providers::to_string(provider));
        }

        json capabilities;
        capabilities["conversation"] = declared->conversation;
        capabilities["vision"] = declared->vision;
        capabilities["file_upload"] = declared->file_upload;
        capabilities["code_execution"] = declared->code_execution;
        capabilities["web_search"] = declared->web_search;
        capabilities["max_context"] = declared->max_context;
        capabilities["models"] = declared->models;
        capabilities["note"] = "Declared capabilities (not runtime UI detection).";

        json document;
        document["provider"] = providers::to_string(provider);
        document["capabilities"] = capabilities;

        return mcp_tools::ok(mcp_types::text_result(document.dump(2)));
    }
};

void register_tool(mcp_tools::ToolRegistry &registry) {
    registry.register_tool(std::make_shared<ProviderCapabilitiesTool>());
}

} // namespace tool_provider_capabilities
