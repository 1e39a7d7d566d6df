// Tests for the JSON-RPC line codec: decoding requests, reporting parse
// failures and encoding envelopes as single lines.

#include "protocol/json_rpc.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <string>

using json = nlohmann::json;
using test_support::check;

namespace test_json_rpc {

// Test: A full request decodes into id, method and params.
static bool test_decode_request() {
    json_rpc::DecodeResult decoded =
        json_rpc::decode(R"({"jsonrpc":"2.0","id":7,"method":"tools/list","params":{"cursor":"x"}})");

    bool passed = check(decoded.success, "Request decodes");
    passed &= check(decoded.request.has_id && decoded.request.id == 7, "Numeric id is extracted");
    passed &= check(decoded.request.method == "tools/list", "Method is extracted");
    passed &= check(decoded.request.params == json{{"cursor", "x"}}, "Params are extracted");
    return passed;
}

// Test: String ids are kept verbatim.
static bool test_decode_string_id() {
    json_rpc::DecodeResult decoded = json_rpc::decode(R"({"jsonrpc":"2.0","id":"req-1","method":"initialize"})");
    return check(decoded.success && decoded.request.id == "req-1", "String id is extracted verbatim");
}

// Test: Missing or non-object params become an empty object.
static bool test_decode_default_params() {
    json_rpc::DecodeResult missing = json_rpc::decode(R"({"id":1,"method":"tools/list"})");
    json_rpc::DecodeResult array = json_rpc::decode(R"({"id":1,"method":"tools/list","params":[1,2]})");

    bool passed = check(missing.success && missing.request.params == json::object(),
                        "Missing params decode as {}");
    passed &= check(array.success && array.request.params == json::object(), "Array params decode as {}");
    return passed;
}

// Test: A message without id is a notification with a null id.
static bool test_decode_notification() {
    json_rpc::DecodeResult decoded = json_rpc::decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");

    bool passed = check(decoded.success, "Notification decodes");
    passed &= check(!decoded.request.has_id, "Notification has no id");
    passed &= check(decoded.request.id.is_null(), "Notification id is null");
    return passed;
}

// Test: An explicit null id is still a request.
static bool test_decode_explicit_null_id() {
    json_rpc::DecodeResult decoded = json_rpc::decode(R"({"id":null,"method":"initialize"})");
    return check(decoded.success && decoded.request.has_id && decoded.request.id.is_null(),
                 "Explicit null id is kept as an id");
}

// Test: A missing method decodes as an empty method name.
static bool test_decode_missing_method() {
    json_rpc::DecodeResult decoded = json_rpc::decode(R"({"id":3})");
    return check(decoded.success && decoded.request.method.empty(), "Missing method decodes as empty string");
}

// Test: Invalid JSON is reported as a parse error.
static bool test_decode_malformed() {
    json_rpc::DecodeResult decoded = json_rpc::decode(R"({"jsonrpc":"2.0","id":1,"method":)");

    bool passed = check(!decoded.success, "Malformed JSON does not decode");
    passed &= check(decoded.error_code == json_rpc::PARSE_ERROR, "Malformed JSON yields -32700");
    passed &= check(decoded.error_message.rfind("Parse error: ", 0) == 0, "Message starts with 'Parse error: '");
    return passed;
}

// Test: Valid JSON that is not an object is an invalid request.
static bool test_decode_non_object() {
    json_rpc::DecodeResult array = json_rpc::decode("[1,2,3]");
    json_rpc::DecodeResult number = json_rpc::decode("42");

    bool passed = check(!array.success && array.error_code == json_rpc::INTERNAL_ERROR,
                        "JSON array yields -32603");
    passed &= check(!number.success && number.error_code == json_rpc::INTERNAL_ERROR,
                    "JSON number yields -32603");
    passed &= check(array.error_message.rfind("Internal error: ", 0) == 0, "Message has the internal error prefix");
    return passed;
}

// Test: Encoded envelopes are exactly one line, even with newlines in strings.
static bool test_encode_single_line() {
    json envelope = json_rpc::build_response(5, json{{"text", "line one\nline two"}});
    std::string line = json_rpc::encode(envelope);

    bool passed = check(!line.empty() && line.back() == '\n', "Encoded line ends with newline");
    passed &= check(std::count(line.begin(), line.end(), '\n') == 1, "Encoded line has no embedded newline");
    passed &= check(json::parse(line) == envelope, "Encoded line parses back to the envelope");
    return passed;
}

// Test: Response builders produce the JSON-RPC 2.0 shapes.
static bool test_build_responses() {
    json success = json_rpc::build_response("a", json{{"ok", true}});
    json failure = json_rpc::build_error_response(nullptr, json_rpc::METHOD_NOT_FOUND, "Method not found: x");

    bool passed = check(success["jsonrpc"] == "2.0" && success["id"] == "a" && success["result"]["ok"] == true,
                        "Success response has jsonrpc, id and result");
    passed &= check(!success.contains("error"), "Success response has no error member");
    passed &= check(failure["id"].is_null() && failure["error"]["code"] == -32601 &&
                        failure["error"]["message"] == "Method not found: x",
                    "Error response has null id, code and message");
    passed &= check(!failure.contains("result"), "Error response has no result member");
    return passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_decode_request();
    all_passed &= test_decode_string_id();
    all_passed &= test_decode_default_params();
    all_passed &= test_decode_notification();
    all_passed &= test_decode_explicit_null_id();
    all_passed &= test_decode_missing_method();
    all_passed &= test_decode_malformed();
    all_passed &= test_decode_non_object();
    all_passed &= test_encode_single_line();
    all_passed &= test_build_responses();
    return all_passed;
}

} // namespace test_json_rpc
