#pragma once
#include <chrono>
#include <string>

std::string getenv_or(const char* key, const std::string& def);
// Falls back to def (with a warning) when the variable is set but not a number.
long getenv_long_or(const char* key, long def);

// UTC, millisecond precision: 2024-05-01T10:20:30.123Z
std::string format_time(std::chrono::system_clock::time_point tp);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::size_t count_words(const std::string& s);
