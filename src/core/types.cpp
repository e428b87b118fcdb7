// MILESCROW - Core Types Implementation
// Copyright (c) 2024 MILESCROW Developers
// MIT License

#include "milescrow/core/types.h"

#include <stdexcept>

namespace milescrow {

namespace detail {

namespace {

int Nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string BytesToHex(const Byte* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

bool HexToBytes(const std::string& hex, Byte* out, size_t len) {
    size_t offset = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        offset = 2;
    }
    if (hex.size() - offset != len * 2) {
        return false;
    }
    for (size_t i = 0; i < len; ++i) {
        int high = Nibble(hex[offset + 2 * i]);
        int low = Nibble(hex[offset + 2 * i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out[i] = static_cast<Byte>((high << 4) | low);
    }
    return true;
}

} // namespace detail

std::optional<Hash256> Hash256::ParseHex(const std::string& hex) {
    std::array<Byte, SIZE> bytes{};
    if (!detail::HexToBytes(hex, bytes.data(), SIZE)) {
        return std::nullopt;
    }
    return Hash256(bytes);
}

Hash256 Hash256::FromHex(const std::string& hex) {
    auto parsed = ParseHex(hex);
    if (!parsed) {
        throw std::invalid_argument("invalid 32-byte hex digest: " + hex);
    }
    return *parsed;
}

std::optional<Address> Address::ParseHex(const std::string& hex) {
    std::array<Byte, SIZE> bytes{};
    if (!detail::HexToBytes(hex, bytes.data(), SIZE)) {
        return std::nullopt;
    }
    return Address(bytes);
}

Address Address::FromHex(const std::string& hex) {
    auto parsed = ParseHex(hex);
    if (!parsed) {
        throw std::invalid_argument("invalid 20-byte hex address: " + hex);
    }
    return *parsed;
}

std::string ShortAddress(const Address& addr) {
    return "0x" + detail::BytesToHex(addr.data(), 4);
}

} // namespace milescrow
