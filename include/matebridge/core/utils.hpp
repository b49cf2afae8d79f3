#ifndef MATEBRIDGE_CORE_UTILS_HPP
#define MATEBRIDGE_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace matebridge {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format millisecond timestamp as local "YYYY-MM-DD HH:MM"
std::string format_local_minutes(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Check if string ends with suffix
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace all occurrences of 'from' with 'to'
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Number of UTF-8 code points
size_t utf8_length(const std::string& s);

// Keep at most max_chars UTF-8 code points
std::string truncate_chars(const std::string& s, size_t max_chars);

// Split text into pieces of at most max_len bytes, preferring newline
// boundaries and never cutting a UTF-8 sequence
std::vector<std::string> split_message_chunks(const std::string& text, size_t max_len);

// ============ Path utilities ============

// Resolve ~ to home directory
std::string resolve_user_path(const std::string& path);

// Get home directory
std::string get_home_dir();

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Get basename (filename) from path
std::string basename(const std::string& path);

// Get directory name from path
std::string dirname(const std::string& path);

// Check if path exists
bool path_exists(const std::string& path);

// Check if path is a directory
bool is_directory(const std::string& path);

// Create directory (and parents if needed)
bool mkdir_p(const std::string& path);

// ============ File utilities ============

// Read a whole file; false if it cannot be opened
bool read_file(const std::string& path, std::string& out);

// Write via a temp file in the same directory and rename over the target
bool write_file_atomic(const std::string& path, const std::string& content);

// ============ Hashing utilities ============

// Compute SHA256 hash as hex string
std::string sha256_hex(const std::string& data);

} // namespace matebridge

#endif // MATEBRIDGE_CORE_UTILS_HPP
