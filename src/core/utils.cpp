#include <kanboard/core/utils.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <random>
#include <openssl/rand.h>

namespace kanboard {

namespace {
// OpenSSL CSPRNG, falling back to std::random_device if it is not seeded
void fill_random(unsigned char* buf, size_t len) {
    if (RAND_bytes(buf, static_cast<int>(len)) == 1) return;
    std::random_device rd;
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<unsigned char>(rd() & 0xFF);
    }
}
} // anonymous namespace

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    int64_t secs = timestamp_ms / 1000;
    int millis = static_cast<int>(timestamp_ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    time_t t = static_cast<time_t>(secs);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return std::string(out);
}

bool parse_timestamp_ms(const std::string& iso, int64_t& out) {
    struct tm tm_buf;
    memset(&tm_buf, 0, sizeof(tm_buf));
    const char* rest = strptime(iso.c_str(), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    if (!rest) return false;
    
    int millis = 0;
    if (*rest == '.') {
        ++rest;
        int digits = 0;
        while (isdigit(static_cast<unsigned char>(*rest))) {
            if (digits < 3) millis = millis * 10 + (*rest - '0');
            ++digits;
            ++rest;
        }
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (*rest != 'Z' && *rest != '\0') return false;
    
    out = static_cast<int64_t>(timegm(&tm_buf)) * 1000 + millis;
    return true;
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    return it != haystack.end();
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && 
           std::equal(prefix.begin(), prefix.end(), s.begin());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string sanitize_name(const std::string& name) {
    std::string out = name;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(out[i]);
        if (!isalnum(c) && c != '_' && c != '-') {
            out[i] = '_';
        }
    }
    return out;
}

// ============ Path utilities ============

bool is_directory(const std::string& path) {
    struct stat st;
    return !path.empty() && stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string join_path(const std::string& base, const std::string& relative) {
    if (base.empty() || relative.empty() || relative[0] == '/') return relative;
    if (base[base.size() - 1] == '/') return base + relative;
    return base + "/" + relative;
}

bool create_parent_directory(const std::string& filepath) {
    size_t pos = filepath.rfind('/');
    if (pos == std::string::npos || pos == 0) return true; // No directory component
    
    std::string dir = filepath.substr(0, pos);
    
    std::string current;
    for (size_t i = 0; i < dir.size(); ++i) {
        current += dir[i];
        if (dir[i] == '/' || i == dir.size() - 1) {
            struct stat st;
            if (stat(current.c_str(), &st) != 0) {
                if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
                    return false;
                }
            }
        }
    }
    
    return true;
}

// ============ Id utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    fill_random(bytes, sizeof(bytes));
    
    // Set version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    // Set variant
    bytes[8] = (bytes[8] & 0x3F) | 0x80;
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    
    return oss.str();
}

std::string generate_short_id() {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    
    std::string stamp;
    uint64_t ms = static_cast<uint64_t>(current_timestamp_ms());
    do {
        stamp += digits[ms % 36];
        ms /= 36;
    } while (ms > 0);
    std::reverse(stamp.begin(), stamp.end());
    
    unsigned char bytes[5];
    fill_random(bytes, sizeof(bytes));
    for (size_t i = 0; i < sizeof(bytes); ++i) {
        stamp += digits[bytes[i] % 36];
    }
    return stamp;
}

} // namespace kanboard
