#ifndef FMCPS_JSON_RPC_HPP
#define FMCPS_JSON_RPC_HPP

// JSON-RPC 2.0 codec for the MCP stdio channel: one envelope per line.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INTERNAL_ERROR = -32603;

// A decoded request or notification.
struct Request {
    json id;             // echoed verbatim in the response; null when absent
    bool has_id = false; // false for notifications
    std::string method;  // empty if missing or not a string
    json params;         // empty object if missing or not an object
};

// Result of decoding one line.
struct DecodeResult {
    bool success = false;
    Request request;
    int error_code = 0;        // PARSE_ERROR or INTERNAL_ERROR when !success
    std::string error_message; // ready to be sent as error.message
};

// Parse one line of text into a Request. Only extracts method, params and id;
// no other structural validation.
DecodeResult decode(const std::string &line);

// Serialize an envelope as one line of compact JSON terminated by '\n'.
std::string encode(const json &envelope);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

} // namespace json_rpc

#endif // FMCPS_JSON_RPC_HPP
