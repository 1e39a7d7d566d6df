#include "protocol/json_rpc.hpp"
#include "utils/utf8.hpp"

namespace json_rpc {

DecodeResult decode(const std::string &line) {
    DecodeResult result;

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &error) {
        // The parser message may quote raw input bytes; keep it valid UTF-8 for the reply.
        std::string detail = error.what();
        utf8::sanitize(detail);
        result.error_code = PARSE_ERROR;
        result.error_message = "Parse error: " + detail;
        return result;
    }

    if (!message.is_object()) {
        result.error_code = INTERNAL_ERROR;
        result.error_message = "Internal error: message is not a JSON object";
        return result;
    }

    result.request.id = get_id(message);
    result.request.has_id = !is_notification(message);
    result.request.method = get_method(message);
    result.request.params = get_params(message);
    result.success = true;
    return result;
}

std::string encode(const json &envelope) {
    // dump() without indentation escapes control characters, so the line has no embedded newline.
    return envelope.dump() + "\n";
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

} // namespace json_rpc
