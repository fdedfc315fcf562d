#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/// Hardware error codes carried by KernelError
static const uint16_t KERNEL_NOT_IMPLEMENTED    = 0x0001;
static const uint16_t KERNEL_DEVICE_UNAVAILABLE = 0x0002;
static const uint16_t KERNEL_CARD_ABSENT        = 0x0003;
static const uint16_t KERNEL_TRANSCEIVE_FAILED  = 0x0004;
static const uint16_t KERNEL_PAYLOAD_TOO_LARGE  = 0x0005;
static const uint16_t KERNEL_CARD_BUSY          = 0x0006;

/// Raised when a byte buffer cannot be turned into a Card
class ConversionError : public std::runtime_error {
public:
    ConversionError(const std::string& message, std::vector<uint8_t> bytes);

    const std::string& message() const { return message_; }

    /// The offending input, kept for diagnostics
    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::string message_;
    std::vector<uint8_t> bytes_;
};

/// Raised by a CardBackend when the physical read/write protocol fails
class KernelError : public std::runtime_error {
public:
    enum class Kind { Read, Write };

    KernelError(Kind kind, const std::string& message, uint16_t code);

    static KernelError read(const std::string& message, uint16_t code) {
        return KernelError(Kind::Read, message, code);
    }
    static KernelError write(const std::string& message, uint16_t code) {
        return KernelError(Kind::Write, message, code);
    }

    Kind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    uint16_t code() const { return code_; }

private:
    Kind kind_;
    std::string message_;
    uint16_t code_;
};

/// Space-separated hex dump, used when reporting raw payloads
std::string hex_string(const std::vector<uint8_t>& bytes);
