#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace warden::utils {

std::string Join(const std::vector<std::string>& items, const std::string& delimiter);

std::string Trim(const std::string& value);

std::string ToLower(std::string value);

// Random UUID v4 in canonical text form.
std::string GenerateUuid();

// Lower-case hex string of the given length drawn from a random UUID.
std::string GenerateHexId(std::size_t length);

// Quotes a value for /bin/sh so it is passed as a single word.
std::string ShellQuote(const std::string& value);

std::string GetEnv(const char* name);

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline double SecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}  // namespace warden::utils
