// Response formatting implementation

#include "response.hpp"
#include <iomanip>
#include <sstream>

namespace dsss {
namespace interface {

const char* statusReason(Status status) {
    switch (status) {
        case Status::Ok:            return "OK";
        case Status::BadRequest:    return "Bad Request";
        case Status::NotFound:      return "Not Found";
        case Status::InternalError: return "Internal Error";
        default:                    return "Unknown";
    }
}

std::string quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

Response::Response(Status status) : status_(status) {}

Response Response::ok() {
    return Response(Status::Ok);
}

Response Response::badRequest(const std::string& detail) {
    Response r(Status::BadRequest);
    r.add("detail", detail);
    return r;
}

Response Response::notFound(const std::string& detail) {
    Response r(Status::NotFound);
    r.add("detail", detail);
    return r;
}

Response Response::internalError(const std::string& detail) {
    Response r(Status::InternalError);
    r.add("detail", detail);
    return r;
}

Response& Response::add(const std::string& key, const std::string& value) {
    fields_.emplace_back(key, quote(value));
    return *this;
}

Response& Response::add(const std::string& key, const char* value) {
    return add(key, std::string(value));
}

Response& Response::add(const std::string& key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(9) << value;
    fields_.emplace_back(key, oss.str());
    return *this;
}

Response& Response::add(const std::string& key, size_t value) {
    fields_.emplace_back(key, std::to_string(value));
    return *this;
}

Response& Response::add(const std::string& key, bool value) {
    fields_.emplace_back(key, value ? "true" : "false");
    return *this;
}

Response& Response::add(const std::string& key, const std::vector<float>& values) {
    std::ostringstream oss;
    oss << std::setprecision(7);
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) oss << ',';
        oss << values[i];
    }
    fields_.emplace_back(key, oss.str());
    return *this;
}

Response& Response::addList(const std::string& key, const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) joined.push_back(',');
        joined += values[i];
    }
    fields_.emplace_back(key, joined);
    return *this;
}

std::string Response::toString() const {
    std::ostringstream oss;
    oss << code() << ' ' << statusReason(status_) << '\n';
    for (const auto& [key, value] : fields_) {
        oss << key << '=' << value << '\n';
    }
    oss << '\n';
    return oss.str();
}

std::string Response::field(const std::string& key) const {
    for (const auto& [k, v] : fields_) {
        if (k == key) return v;
    }
    return "";
}

bool Response::has(const std::string& key) const {
    for (const auto& [k, v] : fields_) {
        if (k == key) return true;
    }
    return false;
}

} // namespace interface
} // namespace dsss
