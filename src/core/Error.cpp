#include "nxlink/Error.hpp"

#include <utility>

namespace nxlink {

Error::Error(std::string code, std::string message, std::string hint)
    : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
    formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
}

const char* Error::what() const noexcept {
    return formatted_.c_str();
}

ProtocolError::ProtocolError(std::string message)
    : Error("E_PROTOCOL", std::move(message)) {}

OperationCancelled::OperationCancelled()
    : Error("E_CANCELLED", "Operation cancelled") {}

}  // namespace nxlink
