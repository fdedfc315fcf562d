#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

/// Set of access capabilities attached to a card, one bit per capability
class Permissions {
public:
    static const Permissions NONE;
    static const Permissions REGULAR;
    static const Permissions IT_SUPPORT;
    static const Permissions OPEN_DOORS;
    static const Permissions ADMIN;
    static const Permissions SUPER_ADMIN;

    /// Mask of all recognized bits
    static constexpr uint8_t KNOWN_BITS = 0x3F;

    constexpr Permissions() : bits_(0) {}

    static constexpr Permissions empty() { return Permissions(); }
    static constexpr Permissions all() { return Permissions(KNOWN_BITS); }

    /// Every capability except NONE
    static constexpr Permissions privileged();

    /// Returns nothing if a bit outside the recognized set is given
    static std::optional<Permissions> from_bits(uint8_t bits);
    static constexpr Permissions from_bits_truncate(uint8_t bits) { return Permissions(bits & KNOWN_BITS); }

    /// Parse "REGULAR | ADMIN" style text, as produced by to_string()
    static std::optional<Permissions> parse(const std::string& text);

    constexpr uint8_t bits() const { return bits_; }
    constexpr bool is_empty() const { return bits_ == 0; }
    constexpr bool is_all() const { return bits_ == KNOWN_BITS; }

    constexpr bool contains(Permissions other) const { return (bits_ & other.bits_) == other.bits_; }
    constexpr bool intersects(Permissions other) const { return (bits_ & other.bits_) != 0; }

    constexpr Permissions set_union(Permissions other) const { return Permissions(bits_ | other.bits_); }
    constexpr Permissions intersection(Permissions other) const { return Permissions(bits_ & other.bits_); }
    constexpr Permissions difference(Permissions other) const { return Permissions(bits_ & ~other.bits_); }
    constexpr Permissions symmetric_difference(Permissions other) const { return Permissions(bits_ ^ other.bits_); }

    std::string to_string() const;

    constexpr Permissions operator|(Permissions other) const { return set_union(other); }
    constexpr Permissions operator&(Permissions other) const { return intersection(other); }
    constexpr Permissions operator-(Permissions other) const { return difference(other); }
    constexpr Permissions operator^(Permissions other) const { return symmetric_difference(other); }

    constexpr bool operator==(Permissions other) const { return bits_ == other.bits_; }
    constexpr bool operator!=(Permissions other) const { return bits_ != other.bits_; }

private:
    constexpr explicit Permissions(uint8_t bits) : bits_(bits) {}

    uint8_t bits_;
};

constexpr Permissions Permissions::NONE{0x01};
constexpr Permissions Permissions::REGULAR{0x02};
constexpr Permissions Permissions::IT_SUPPORT{0x04};
constexpr Permissions Permissions::OPEN_DOORS{0x08};
constexpr Permissions Permissions::ADMIN{0x10};
constexpr Permissions Permissions::SUPER_ADMIN{0x20};

constexpr Permissions Permissions::privileged() {
    return all().symmetric_difference(NONE);
}

std::ostream& operator<<(std::ostream& os, Permissions permissions);
