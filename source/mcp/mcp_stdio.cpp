#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8.hpp"

#include <csignal>
#include <iostream>
#include <string>

namespace mcp_stdio {

namespace {

volatile std::sig_atomic_t shutdown_flag = 0;

std::string trim(const std::string &text) {
    const char *whitespace = " \t\r\n\f\v";
    std::string::size_type first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    std::string::size_type last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::string internal_error_line(const std::string &detail) {
    std::string message = "Internal error: " + detail;
    utf8::sanitize(message);
    return json_rpc::encode(json_rpc::build_error_response(nullptr, json_rpc::INTERNAL_ERROR, message));
}

} // namespace

bool read_line(std::istream &input, std::string &line) {
    if (!std::getline(input, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool write_message(std::ostream &output, const std::string &line) {
    output.write(line.data(), static_cast<std::streamsize>(line.size()));
    output.flush();
    return static_cast<bool>(output);
}

void log_message(const std::string &message) {
    std::cerr << "[fmcps] " << message << std::endl;
}

std::string process_line(const std::string &line, const mcp_dispatch::Dispatcher &dispatcher) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return "";
    }

    try {
        json_rpc::DecodeResult decoded = json_rpc::decode(trimmed);
        if (!decoded.success) {
            log_message("Rejected incoming message: " + decoded.error_message);
            return json_rpc::encode(
                json_rpc::build_error_response(nullptr, decoded.error_code, decoded.error_message));
        }

        json_rpc::json response = dispatcher.dispatch_message(decoded.request);
        if (response.is_null()) {
            return "";
        }
        return json_rpc::encode(response);
    } catch (const std::exception &error) {
        log_message("Failed to process message: " + std::string(error.what()));
        return internal_error_line(error.what());
    }
}

void request_shutdown() {
    shutdown_flag = 1;
}

bool shutdown_requested() {
    return shutdown_flag != 0;
}

void reset_shutdown_request() {
    shutdown_flag = 0;
}

int serve(std::istream &input, std::ostream &output, const mcp_dispatch::Dispatcher &dispatcher) {
    std::string line;
    while (!shutdown_requested()) {
        if (!read_line(input, line)) {
            if (shutdown_requested()) {
                log_message("Interrupted. Shutting down.");
            } else {
                log_message("EOF on stdin. Shutting down.");
            }
            return 0;
        }

        std::string response_line = process_line(line, dispatcher);
        if (response_line.empty()) {
            debug_log::log("No response for line.");
            continue;
        }

        if (!write_message(output, response_line)) {
            log_message("Output stream is no longer writable. Terminating.");
            return 1;
        }
    }

    log_message("Shutdown requested. Shutting down.");
    return 0;
}

} // namespace mcp_stdio
