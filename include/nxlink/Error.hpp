#pragma once

#include <exception>
#include <string>

namespace nxlink {

// Base for failures raised by the link engine and the CLI. OS-level socket
// failures are reported as std::system_error instead.
class Error : public std::exception {
public:
    Error(std::string code, std::string message, std::string hint = {});

    const char* what() const noexcept override;

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

// A received datagram or field did not match the wire format.
class ProtocolError : public Error {
public:
    explicit ProtocolError(std::string message);
};

// The in-flight operation was abandoned because its token was cancelled.
class OperationCancelled : public Error {
public:
    OperationCancelled();
};

}  // namespace nxlink
