// Response formatting for the service interface

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace dsss {
namespace interface {

// Status codes follow HTTP so a web front end can pass them through
enum class Status {
    Ok = 200,
    BadRequest = 400,
    NotFound = 404,
    InternalError = 500
};

const char* statusReason(Status status);

class Response {
public:
    // Factory methods
    static Response ok();
    static Response badRequest(const std::string& detail);
    static Response notFound(const std::string& detail);
    static Response internalError(const std::string& detail);

    // Append a field; strings are quoted and escaped
    Response& add(const std::string& key, const std::string& value);
    Response& add(const std::string& key, const char* value);
    Response& add(const std::string& key, double value);
    Response& add(const std::string& key, size_t value);
    Response& add(const std::string& key, bool value);
    Response& add(const std::string& key, const std::vector<float>& values);
    Response& addList(const std::string& key, const std::vector<std::string>& values);

    // "<code> <reason>" line, one key=value line per field, blank line
    std::string toString() const;

    Status status() const { return status_; }
    int code() const { return static_cast<int>(status_); }

    // Formatted text of a field (strings keep their quotes), empty if absent
    std::string field(const std::string& key) const;
    bool has(const std::string& key) const;

private:
    Status status_;
    std::vector<std::pair<std::string, std::string>> fields_;

    explicit Response(Status status);
};

// Double-quote a string, escaping quote, backslash and newline
std::string quote(const std::string& text);

} // namespace interface
} // namespace dsss
