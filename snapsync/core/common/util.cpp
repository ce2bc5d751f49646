// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <array>
#include <cstdio>

namespace snapsync {

static constexpr std::string_view kHexDigits{"0123456789abcdef"};

static std::optional<uint8_t> hex_digit_value(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

ByteView zeroless_view(ByteView data) {
    const auto first_nonzero{std::ranges::find_if_not(data, [](uint8_t b) { return b == 0; })};
    return data.substr(static_cast<size_t>(first_nonzero - data.begin()));
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string out;
    out.reserve(bytes.size() * 2 + 2);
    if (with_prefix) {
        out += "0x";
    }
    for (const uint8_t b : bytes) {
        out += kHexDigits[b >> 4];
        out += kHexDigits[b & 0x0f];
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }

    Bytes out;
    out.reserve((hex.size() + 1) / 2);
    if (hex.size() % 2 != 0) {
        const auto digit{hex_digit_value(hex.front())};
        if (!digit) return std::nullopt;
        out.push_back(*digit);
        hex.remove_prefix(1);
    }
    for (size_t i{0}; i < hex.size(); i += 2) {
        const auto hi{hex_digit_value(hex[i])};
        const auto lo{hex_digit_value(hex[i + 1])};
        if (!hi || !lo) return std::nullopt;
        out.push_back(static_cast<uint8_t>((*hi << 4) | *lo));
    }
    return out;
}

std::string human_size(uint64_t bytes, const char* unit) {
    static constexpr std::array<const char*, 5> kPrefixes{"", "K", "M", "G", "T"};
    size_t prefix{0};
    auto value{static_cast<double>(bytes)};
    while (value >= static_cast<double>(kKibi) && prefix + 1 < kPrefixes.size()) {
        value /= static_cast<double>(kKibi);
        ++prefix;
    }
    std::array<char, 64> output{};
    const int written{std::snprintf(output.data(), output.size(), "%.02lf %s%s", value, kPrefixes[prefix], unit)};
    return written > 0 ? std::string{output.data()} : std::string{};
}

size_t prefix_length(ByteView a, ByteView b) {
    const auto mismatch{std::ranges::mismatch(a, b)};
    return static_cast<size_t>(mismatch.in1 - a.begin());
}

}  // namespace snapsync
