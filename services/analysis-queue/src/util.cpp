#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_long_or(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        std::size_t used = 0;
        long parsed = std::stol(v, &used);
        if (used != std::string(v).size()) throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring " << key << "=\"" << v << "\" (not a number), using " << def << std::endl;
        return def;
    }
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto b = std::find_if(s.begin(), s.end(), not_space);
    auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return b < e ? std::string(b, e) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::size_t count_words(const std::string& s) {
    std::istringstream ss(s);
    std::string w;
    std::size_t n = 0;
    while (ss >> w) ++n;
    return n;
}
