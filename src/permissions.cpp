#include "permissions.hpp"

#include <utility>

// Flag name table, in bit order
static const std::pair<Permissions, const char*> PERMISSION_NAMES[] = {
    {Permissions::NONE, "NONE"},
    {Permissions::REGULAR, "REGULAR"},
    {Permissions::IT_SUPPORT, "IT_SUPPORT"},
    {Permissions::OPEN_DOORS, "OPEN_DOORS"},
    {Permissions::ADMIN, "ADMIN"},
    {Permissions::SUPER_ADMIN, "SUPER_ADMIN"},
};

std::optional<Permissions> Permissions::from_bits(uint8_t bits) {
    if ((bits & ~KNOWN_BITS) != 0) {
        return std::nullopt;
    }
    return Permissions(bits);
}

std::optional<Permissions> Permissions::parse(const std::string& text) {
    Permissions result;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('|', pos);
        if (end == std::string::npos) end = text.size();

        std::string token = text.substr(pos, end - pos);
        size_t first = token.find_first_not_of(" \t");
        size_t last = token.find_last_not_of(" \t");
        token = (first == std::string::npos) ? "" : token.substr(first, last - first + 1);

        if (token.empty()) {
            // "" and "(empty)" both mean no capabilities, but only on their own
            if (pos != 0 || end != text.size()) return std::nullopt;
        } else if (token == "(empty)") {
            if (pos != 0 || end != text.size()) return std::nullopt;
        } else {
            bool found = false;
            for (const auto& entry : PERMISSION_NAMES) {
                if (token == entry.second) {
                    result = result.set_union(entry.first);
                    found = true;
                    break;
                }
            }
            if (!found) return std::nullopt;
        }
        pos = end + 1;
    }
    return result;
}

std::string Permissions::to_string() const {
    if (is_empty()) {
        return "(empty)";
    }
    std::string out;
    for (const auto& entry : PERMISSION_NAMES) {
        if (contains(entry.first)) {
            if (!out.empty()) out += " | ";
            out += entry.second;
        }
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, Permissions permissions) {
    return os << permissions.to_string();
}
