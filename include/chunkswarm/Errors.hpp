#pragma once

#include <stdexcept>
#include <string>

namespace chunkswarm {

enum class ErrorKind {
    Transport,
    Planning
};

const char* error_kind_to_string(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Raised before any transfer starts: the directory had nothing usable for the file.
class PlanningError : public Error {
public:
    explicit PlanningError(const std::string& message)
        : Error(ErrorKind::Planning, message) {}
};

}  // namespace chunkswarm
