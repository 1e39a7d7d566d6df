#ifndef FMCPS_PLATFORM_ABI_HPP
#define FMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstdint>
#include <string>
#include <vector>

namespace platform {

// Outcome of a path-based operation.
enum class PathStatus {
    Ok,
    NotFound,
    NotADirectory,
    Failed
};

// Result of reading a whole file.
struct FileReadResult {
    PathStatus status = PathStatus::Failed;
    std::string contents;
    std::string error_detail;
};

// Result of writing a whole file.
struct FileWriteResult {
    bool success = false;
    std::string error_detail;
};

// One entry of a directory listing. Type and size follow symlinks.
struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
    std::uintmax_t size = 0; // 0 for anything that is not a regular file
};

// Result of listing a directory. Entries are in filesystem order (unsorted).
struct DirectoryListResult {
    PathStatus status = PathStatus::Failed;
    std::vector<DirectoryEntry> entries;
    std::string error_detail;
};

// Read the entire contents of a file (binary, no newline translation).
// NotFound if nothing exists at file_path; Failed for directories and I/O errors.
FileReadResult read_file_contents(const std::string &file_path);

// Write contents to file_path, replacing any existing file.
// Missing parent directories are created first.
FileWriteResult write_file_contents(const std::string &file_path, const std::string &contents);

// List the entries of a directory (without "." and "..").
DirectoryListResult list_directory(const std::string &directory_path);

// Current local wall-clock time as ISO-8601 with microseconds,
// e.g. "2024-11-05T14:03:27.104233". No UTC offset suffix.
std::string local_timestamp_iso8601();

// Install handler for signal_number without SA_RESTART, so a blocking read
// on stdin returns when the signal arrives.
bool install_signal_handler(int signal_number, void (*handler)(int));

// Set signal_number to SIG_IGN. Used for SIGPIPE, so a write to a closed
// stdout fails with EPIPE instead of killing the process.
bool ignore_signal(int signal_number);

} // namespace platform

#endif // FMCPS_PLATFORM_ABI_HPP
