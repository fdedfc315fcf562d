#include "card_registry.hpp"

#include <iostream>
#include <string>
#include <vector>

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << "\n"
              << "       " << prog << " --decode <json>\n"
              << "       " << prog << " --encode <id> <permissions>\n"
              << "       " << prog << " --scan\n"
              << "\n"
              << "Access card registry demo\n"
              << "\n"
              << "Options:\n"
              << "  (none)                       Store the default card, encode it and decode it back\n"
              << "  --decode <json>              Decode a card payload, e.g. '{\"id\":1,\"permissions\":2}'\n"
              << "  --encode <id> <permissions>  Encode a card, permissions as 'REGULAR | ADMIN'\n"
              << "  --scan                       Sense cards with the reader and list them\n"
              << "  --help                       Show this help message\n";
}

static int run_demo() {
    CardRegistry registry;
    registry.put(Card());

    auto bytes = registry.get(0)->encode();
    try {
        Card card = Card::decode(bytes);
        std::cout << card << std::endl;
    } catch (const ConversionError& e) {
        std::cerr << e.message() << " - [" << hex_string(e.bytes()) << "]" << std::endl;
        return 1;
    }
    std::cout << "Payload: " << std::string(bytes.begin(), bytes.end()) << std::endl;
    return 0;
}

static int run_decode(const std::string& text) {
    try {
        Card card = Card::decode(std::vector<uint8_t>(text.begin(), text.end()));
        std::cout << card << std::endl;
    } catch (const ConversionError& e) {
        std::cerr << "Error: " << e.message() << " - [" << hex_string(e.bytes()) << "]" << std::endl;
        return 1;
    }
    return 0;
}

static int run_encode(const std::string& id_text, const std::string& perm_text) {
    auto id = Card::parse_id(id_text);
    if (!id) {
        std::cerr << "Invalid card id: " << id_text << std::endl;
        return 1;
    }
    auto permissions = Permissions::parse(perm_text);
    if (!permissions) {
        std::cerr << "Unknown permissions: " << perm_text << std::endl;
        return 1;
    }
    auto bytes = Card(*id, *permissions).encode();
    std::cout << std::string(bytes.begin(), bytes.end()) << std::endl;
    return 0;
}

static int run_scan() {
    CardRegistry registry(create_card_backend());
    CardBackend& backend = registry.backend();

    std::cout << "Sensing cards..." << std::endl;
    backend.sense();

    for (uint16_t id : backend.present()) {
        try {
            registry.put(backend.read(id));
        } catch (const KernelError& e) {
            std::cerr << "Card " << id << ": " << e.what() << std::endl;
        }
    }

    std::cout << registry.size() << " card(s) in range" << std::endl;
    for (const auto& card : registry.cards()) {
        std::cout << "  " << card << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        if (args.empty()) {
            return run_demo();
        }
        const std::string& cmd = args[0];
        if (cmd == "--help" || cmd == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (cmd == "--decode" && args.size() == 2) {
            return run_decode(args[1]);
        } else if (cmd == "--encode" && args.size() == 3) {
            return run_encode(args[1], args[2]);
        } else if (cmd == "--scan" && args.size() == 1) {
            return run_scan();
        }
        std::cerr << "Unknown option: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
