#include "mcp/mcp_error.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_error {

Error make_error(ErrorKind kind, const std::string &message) {
    Error error;
    error.kind = kind;
    error.message = message;
    return error;
}

Error make_json_rpc_error(int code, const std::string &message, const json &data) {
    Error error;
    error.kind = ErrorKind::JsonRpc;
    error.message = message;
    error.explicit_code = code;
    error.data = data;
    return error;
}

int code_of(const Error &error) {
    switch (error.kind) {
    case ErrorKind::JsonRpc:
        return error.explicit_code;
    case ErrorKind::ToolNotFound:
        return json_rpc::TOOL_NOT_FOUND;
    case ErrorKind::InvalidParams:
        return json_rpc::INVALID_PARAMS;
    case ErrorKind::PermissionDenied:
        return json_rpc::PERMISSION_DENIED;
    case ErrorKind::Automation:
        return json_rpc::AUTOMATION_ERROR;
    case ErrorKind::Serialization:
        return json_rpc::INTERNAL_ERROR;
    case ErrorKind::Io:
        return json_rpc::IO_ERROR;
    case ErrorKind::Internal:
        return json_rpc::INTERNAL_ERROR;
    }
    return json_rpc::INTERNAL_ERROR;
}

const char *kind_label(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::JsonRpc:
        return "JSON-RPC error";
    case ErrorKind::ToolNotFound:
        return "tool not found";
    case ErrorKind::InvalidParams:
        return "invalid parameters";
    case ErrorKind::PermissionDenied:
        return "permission denied";
    case ErrorKind::Automation:
        return "automation error";
    case ErrorKind::Serialization:
        return "serialization error";
    case ErrorKind::Io:
        return "I/O error";
    case ErrorKind::Internal:
        return "internal error";
    }
    return "internal error";
}

std::string describe(const Error &error) {
    if (error.kind == ErrorKind::JsonRpc) {
        return error.message;
    }
    return std::string(kind_label(error.kind)) + ": " + error.message;
}

json to_json_rpc_error(const Error &error) {
    json error_object;
    error_object["code"] = code_of(error);
    error_object["message"] = describe(error);
    if (!error.data.is_null()) {
        error_object["data"] = error.data;
    }
    return error_object;
}

} // namespace mcp_error
