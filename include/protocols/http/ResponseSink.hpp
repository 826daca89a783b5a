#pragma once

#include <boost/beast/http/fields.hpp>
#include <cstddef>
#include <string_view>

namespace sg::protocols::http {

namespace beast_http = boost::beast::http;

// Where a response is written: the client socket in production, a buffer in tests.
// Every write returns false once the client can no longer be reached.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    virtual bool writeHead(unsigned int status, const beast_http::fields& headers) = 0;
    virtual bool writeBody(const char* data, std::size_t size) = 0;
    virtual bool finish() = 0;

    [[nodiscard]] virtual bool headWritten() const noexcept = 0;
    [[nodiscard]] virtual bool finished() const noexcept = 0;

    bool writeText(const std::string_view s) { return writeBody(s.data(), s.size()); }
};

}
