#include "card.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <limits>
#include <stdexcept>
#include <sstream>

static const char* FIELD_ID = "id";
static const char* FIELD_PERMISSIONS = "permissions";

// Fetch an unsigned integer field no larger than max_value
static uint64_t unsigned_field(const nlohmann::json& object, const char* name, uint64_t max_value,
                               const std::vector<uint8_t>& bytes) {
    auto it = object.find(name);
    if (it == object.end()) {
        throw ConversionError(std::string("Missing field '") + name + "'", bytes);
    }
    if (!it->is_number_unsigned()) {
        throw ConversionError(std::string("Field '") + name + "' is not an unsigned integer", bytes);
    }
    uint64_t value = it->get<uint64_t>();
    if (value > max_value) {
        std::ostringstream oss;
        oss << "Field '" << name << "' out of range: " << value << " > " << max_value;
        throw ConversionError(oss.str(), bytes);
    }
    return value;
}

std::vector<uint8_t> Card::encode() const {
    nlohmann::json object = {
        {FIELD_ID, id_},
        {FIELD_PERMISSIONS, permissions_.bits()},
    };
    std::string text = object.dump();
    return std::vector<uint8_t>(text.begin(), text.end());
}

Card Card::decode(const std::vector<uint8_t>& bytes) {
    const auto object = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (object.is_discarded()) {
        throw ConversionError("Cant convert to Card: malformed JSON", bytes);
    }
    if (!object.is_object()) {
        throw ConversionError("Cant convert to Card: expected a JSON object", bytes);
    }

    auto id = unsigned_field(object, FIELD_ID, std::numeric_limits<uint16_t>::max(), bytes);
    auto bits = unsigned_field(object, FIELD_PERMISSIONS, std::numeric_limits<uint8_t>::max(), bytes);

    auto permissions = Permissions::from_bits(static_cast<uint8_t>(bits));
    if (!permissions) {
        std::ostringstream oss;
        oss << "Unknown permission bits 0x" << std::hex << (int)(bits & ~Permissions::KNOWN_BITS);
        throw ConversionError(oss.str(), bytes);
    }

    return Card(static_cast<uint16_t>(id), *permissions);
}

Card Card::decode(const uint8_t* data, size_t size) {
    return decode(std::vector<uint8_t>(data, data + size));
}

std::ostream& operator<<(std::ostream& os, const Card& card) {
    return os << "Card { id: " << card.id() << ", permissions: " << card.permissions() << " }";
}

std::optional<uint16_t> Card::parse_id(const std::string& text) {
    // stoul skips whitespace and accepts a sign, neither is an id
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }
    size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &pos);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (pos != text.size() || value > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}
