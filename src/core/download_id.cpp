/**
 * @file download_id.cpp
 * @brief Generation and parsing of download identifiers
 */

#include "kcenon/delivery_client/core/download_types.h"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::delivery_client {

auto download_id::generate() -> download_id {
    download_id id;

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>((part1 >> (i * 8)) & 0xFF);
        id.bytes[i + 8] = static_cast<uint8_t>((part2 >> (i * 8)) & 0xFF);
    }

    // Version 4, RFC 4122 variant
    id.bytes[6] = (id.bytes[6] & 0x0F) | 0x40;
    id.bytes[8] = (id.bytes[8] & 0x3F) | 0x80;

    return id;
}

auto download_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

auto download_id::from_string(std::string_view str) -> std::optional<download_id> {
    if (str.size() >= 2 && str.front() == '{' && str.back() == '}') {
        str = str.substr(1, str.size() - 2);
    }

    // Dashes are only accepted at the canonical positions
    if (str.size() != 36) {
        return std::nullopt;
    }

    std::string hex_str;
    hex_str.reserve(32);

    for (std::size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_position) {
            if (c != '-') return std::nullopt;
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex_str += c;
    }

    download_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        std::string byte_str = hex_str.substr(i * 2, 2);
        id.bytes[i] = static_cast<uint8_t>(std::stoul(byte_str, nullptr, 16));
    }

    return id;
}

}  // namespace kcenon::delivery_client
