#pragma once

#include <stdexcept>
#include <string>

namespace dsss {

// Bad caller input: unknown coding scheme or stage name, non-positive
// window size, request field out of range. Never retried.
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
};

// Unknown simulation id (usually evicted) or missing stage for a known id.
class NotFound : public std::out_of_range {
public:
    explicit NotFound(const std::string& what) : std::out_of_range(what) {}
};

} // namespace dsss
