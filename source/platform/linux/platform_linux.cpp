#include "platform/platform_abi.hpp"

#include <signal.h>
#include <sys/time.h>
#include <time.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace platform {

namespace fs = std::filesystem;

FileReadResult read_file_contents(const std::string &file_path) {
    FileReadResult result;

    std::error_code status_error;
    fs::file_status file_status = fs::status(file_path, status_error);
    if (file_status.type() == fs::file_type::not_found) {
        result.status = PathStatus::NotFound;
        result.error_detail = "No such file or directory";
        return result;
    }
    if (status_error) {
        result.error_detail = status_error.message();
        return result;
    }
    if (file_status.type() == fs::file_type::directory) {
        result.error_detail = "Is a directory";
        return result;
    }

    std::ifstream file_stream(file_path, std::ios::in | std::ios::binary);
    if (!file_stream.is_open()) {
        result.error_detail = std::strerror(errno);
        return result;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    if (file_stream.bad()) {
        result.error_detail = "read error";
        return result;
    }

    result.status = PathStatus::Ok;
    result.contents = string_stream.str();
    return result;
}

FileWriteResult write_file_contents(const std::string &file_path, const std::string &contents) {
    FileWriteResult result;

    fs::path parent_directory = fs::path(file_path).parent_path();
    if (!parent_directory.empty()) {
        std::error_code create_error;
        fs::create_directories(parent_directory, create_error);
        if (create_error) {
            result.error_detail = "cannot create directory " + parent_directory.string() + ": " +
                                  create_error.message();
            return result;
        }
    }

    std::ofstream file_stream(file_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        result.error_detail = "cannot open " + file_path + ": " + std::strerror(errno);
        return result;
    }
    file_stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file_stream.close();
    if (file_stream.fail()) {
        result.error_detail = "write to " + file_path + " failed";
        return result;
    }

    result.success = true;
    return result;
}

DirectoryListResult list_directory(const std::string &directory_path) {
    DirectoryListResult result;

    std::error_code status_error;
    fs::file_status directory_status = fs::status(directory_path, status_error);
    if (directory_status.type() == fs::file_type::not_found) {
        result.status = PathStatus::NotFound;
        return result;
    }
    if (status_error) {
        result.error_detail = status_error.message();
        return result;
    }
    if (directory_status.type() != fs::file_type::directory) {
        result.status = PathStatus::NotADirectory;
        return result;
    }

    std::error_code iterate_error;
    fs::directory_iterator iterator(directory_path, iterate_error);
    fs::directory_iterator end_iterator;
    for (; !iterate_error && iterator != end_iterator; iterator.increment(iterate_error)) {
        const fs::directory_entry &entry = *iterator;

        DirectoryEntry listed_entry;
        listed_entry.name = entry.path().filename().string();

        // Broken symlinks and vanished entries are listed as 0-byte files.
        std::error_code entry_error;
        listed_entry.is_directory = entry.is_directory(entry_error);
        if (!listed_entry.is_directory && entry.is_regular_file(entry_error)) {
            std::uintmax_t size = entry.file_size(entry_error);
            listed_entry.size = entry_error ? 0 : size;
        }
        result.entries.push_back(listed_entry);
    }

    if (iterate_error) {
        result.entries.clear();
        result.error_detail = iterate_error.message();
        return result;
    }

    result.status = PathStatus::Ok;
    return result;
}

std::string local_timestamp_iso8601() {
    struct timeval now;
    gettimeofday(&now, nullptr);

    time_t seconds = now.tv_sec;
    struct tm local_time;
    localtime_r(&seconds, &local_time);

    char date_time[32];
    std::strftime(date_time, sizeof(date_time), "%Y-%m-%dT%H:%M:%S", &local_time);

    char microseconds[8];
    std::snprintf(microseconds, sizeof(microseconds), ".%06ld", static_cast<long>(now.tv_usec));

    return std::string(date_time) + microseconds;
}

bool install_signal_handler(int signal_number, void (*handler)(int)) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: interrupt the blocking stdin read
    return sigaction(signal_number, &action, nullptr) == 0;
}

bool ignore_signal(int signal_number) {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = SIG_IGN;
    sigemptyset(&action.sa_mask);
    return sigaction(signal_number, &action, nullptr) == 0;
}

} // namespace platform
