#pragma once

#include <string>
#include <string_view>

namespace sg::crypto::hash {

// 32 raw digest bytes
std::string hmacSha256Raw(std::string_view key, std::string_view data);

// Standard alphabet, '=' padded
std::string base64(std::string_view raw);

// base64() with '+' -> '-' and '/' -> '_', padding kept
std::string base64Url(std::string_view raw);

// Runs in time independent of where the inputs differ (length leaks).
bool constantTimeEquals(std::string_view a, std::string_view b);

}
