#pragma once

#include "errors.hpp"
#include "permissions.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/// An access token record: a 16-bit identity bound to a permission set
class Card {
public:
    /// Default card: id 0 with REGULAR permissions
    Card() : id_(0), permissions_(Permissions::REGULAR) {}
    Card(uint16_t id, Permissions permissions) : id_(id), permissions_(permissions) {}

    uint16_t id() const { return id_; }
    Permissions permissions() const { return permissions_; }

    /// Whether this card holds every requested capability
    bool is(Permissions permissions) const { return permissions_.contains(permissions); }

    /// Serialize to the wire format: {"id":<u16>,"permissions":<bitmask>}
    std::vector<uint8_t> encode() const;

    /// Parse the wire format
    /// Throws ConversionError on malformed JSON, missing or mistyped fields,
    /// and permission bits outside the recognized set
    static Card decode(const std::vector<uint8_t>& bytes);
    static Card decode(const uint8_t* data, size_t size);

    /// Parse a decimal card id; nullopt on trailing text, signs or values above 0xFFFF
    static std::optional<uint16_t> parse_id(const std::string& text);

    bool operator==(const Card& other) const {
        return id_ == other.id_ && permissions_ == other.permissions_;
    }
    bool operator!=(const Card& other) const { return !(*this == other); }

private:
    uint16_t id_;
    Permissions permissions_;
};

std::ostream& operator<<(std::ostream& os, const Card& card);
