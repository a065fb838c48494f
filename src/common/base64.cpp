#include "rynamo/common/base64.hpp"

#include <array>
#include <cstdint>

namespace rynamo {

namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<std::int8_t, 256> make_reverse_table()
{
    std::array<std::int8_t, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (std::size_t index = 0U; index < kAlphabet.size(); ++index) {
        table[static_cast<unsigned char>(kAlphabet[index])] = static_cast<std::int8_t>(index);
    }
    return table;
}

constexpr auto kReverse = make_reverse_table();

}  // namespace

std::string base64_encode(std::string_view bytes)
{
    std::string encoded;
    encoded.reserve(((bytes.size() + 2U) / 3U) * 4U);

    std::size_t index = 0U;
    for (; index + 3U <= bytes.size(); index += 3U) {
        const auto b0 = static_cast<unsigned char>(bytes[index]);
        const auto b1 = static_cast<unsigned char>(bytes[index + 1U]);
        const auto b2 = static_cast<unsigned char>(bytes[index + 2U]);
        encoded.push_back(kAlphabet[b0 >> 2U]);
        encoded.push_back(kAlphabet[((b0 & 0x03U) << 4U) | (b1 >> 4U)]);
        encoded.push_back(kAlphabet[((b1 & 0x0FU) << 2U) | (b2 >> 6U)]);
        encoded.push_back(kAlphabet[b2 & 0x3FU]);
    }

    const auto remaining = bytes.size() - index;
    if (remaining == 1U) {
        const auto b0 = static_cast<unsigned char>(bytes[index]);
        encoded.push_back(kAlphabet[b0 >> 2U]);
        encoded.push_back(kAlphabet[(b0 & 0x03U) << 4U]);
        encoded.append("==");
    } else if (remaining == 2U) {
        const auto b0 = static_cast<unsigned char>(bytes[index]);
        const auto b1 = static_cast<unsigned char>(bytes[index + 1U]);
        encoded.push_back(kAlphabet[b0 >> 2U]);
        encoded.push_back(kAlphabet[((b0 & 0x03U) << 4U) | (b1 >> 4U)]);
        encoded.push_back(kAlphabet[(b1 & 0x0FU) << 2U]);
        encoded.push_back('=');
    }
    return encoded;
}

std::optional<std::string> base64_decode(std::string_view text)
{
    if (text.size() % 4U != 0U) {
        return std::nullopt;
    }

    std::size_t padding = 0U;
    if (!text.empty() && text.back() == '=') {
        ++padding;
        if (text.size() > 1U && text[text.size() - 2U] == '=') {
            ++padding;
        }
    }

    std::string decoded;
    decoded.reserve(text.size() / 4U * 3U);
    const auto data_length = text.size() - padding;
    std::uint32_t accumulator = 0U;
    std::size_t bits = 0U;
    for (std::size_t index = 0U; index < data_length; ++index) {
        const auto value = kReverse[static_cast<unsigned char>(text[index])];
        if (value < 0) {
            return std::nullopt;
        }
        accumulator = (accumulator << 6U) | static_cast<std::uint32_t>(value);
        bits += 6U;
        if (bits >= 8U) {
            bits -= 8U;
            decoded.push_back(static_cast<char>((accumulator >> bits) & 0xFFU));
        }
    }
    // Leftover bits must be zero for a canonical encoding.
    if ((accumulator & ((1U << bits) - 1U)) != 0U) {
        return std::nullopt;
    }
    return decoded;
}

}  // namespace rynamo
