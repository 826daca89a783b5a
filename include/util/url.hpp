#pragma once

#include <boost/beast/core/string.hpp>
#include <string>
#include <string_view>

namespace sg::util {

inline std::string toString(const boost::beast::string_view sv) { return {sv.data(), sv.size()}; }

// Percent-decode; '+' becomes a space only when plusAsSpace (query components).
std::string percentDecode(std::string_view s, bool plusAsSpace = false);

// Decoded path of an origin-form ("/a/b?x=1") or absolute-form request target.
std::string targetPath(std::string_view target);

// Decoded value of the first `name` query parameter, empty when absent.
std::string queryParam(std::string_view target, std::string_view name);

// Resolves a Location header value against the URL that produced it.
std::string resolveLocation(const std::string& base, const std::string& location);

}
