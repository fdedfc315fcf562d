#include "errors.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

static std::string describe_kernel_error(KernelError::Kind kind, const std::string& message, uint16_t code) {
    std::ostringstream oss;
    oss << (kind == KernelError::Kind::Read ? "ReadError" : "WriteError")
        << "(message: " << message << ", code: " << code << ")";
    return oss.str();
}

ConversionError::ConversionError(const std::string& message, std::vector<uint8_t> bytes)
    : std::runtime_error(message), message_(message), bytes_(std::move(bytes)) {}

KernelError::KernelError(Kind kind, const std::string& message, uint16_t code)
    : std::runtime_error(describe_kernel_error(kind, message, code)),
      kind_(kind), message_(message), code_(code) {}

std::string hex_string(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); i++) {
        if (i > 0) oss << " ";
        oss << std::setw(2) << (int)bytes[i];
    }
    return oss.str();
}
