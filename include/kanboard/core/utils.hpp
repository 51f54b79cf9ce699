#ifndef kanboard_CORE_UTILS_HPP
#define kanboard_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace kanboard {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// Parse an ISO 8601 UTC timestamp (with or without milliseconds).
// Returns false if the string is not in that form.
bool parse_timestamp_ms(const std::string& iso, int64_t& out);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Case-insensitive substring test (ASCII folding)
bool contains_icase(const std::string& haystack, const std::string& needle);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Replace every character outside [A-Za-z0-9_-] with '_'
std::string sanitize_name(const std::string& name);

// ============ Path utilities ============

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

bool is_directory(const std::string& path);

// `relative` appended to `base`; absolute paths and an empty base pass through
std::string join_path(const std::string& base, const std::string& relative);

// ============ Id utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// Short sortable id: base-36 millisecond timestamp + 5 random base-36 chars
std::string generate_short_id();

} // namespace kanboard

#endif // kanboard_CORE_UTILS_HPP
