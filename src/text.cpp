// text.cpp - lenient UTF-8 decoding

#include "fastssh/text.hpp"

#include <string_view>

namespace fastssh
{

    namespace
    {

        constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

        // length of a well-formed sequence starting at data[pos], 0 if malformed
        [[nodiscard]] auto sequence_length(std::span<std::uint8_t const> data, std::size_t pos) noexcept -> std::size_t
        {
            auto const lead = data[pos];
            auto const remaining = data.size() - pos;

            auto continuation = [&](std::size_t offset, std::uint8_t lo = 0x80, std::uint8_t hi = 0xBF) noexcept
            {
                return offset < remaining && data[pos + offset] >= lo && data[pos + offset] <= hi;
            };

            if (lead < 0x80)
            {
                return 1;
            }
            if (lead >= 0xC2 && lead <= 0xDF)
            {
                return continuation(1) ? 2 : 0;
            }
            if (lead >= 0xE0 && lead <= 0xEF)
            {
                // reject overlongs (E0) and surrogates (ED)
                auto const lo = lead == 0xE0 ? std::uint8_t{0xA0} : std::uint8_t{0x80};
                auto const hi = lead == 0xED ? std::uint8_t{0x9F} : std::uint8_t{0xBF};
                return continuation(1, lo, hi) && continuation(2) ? 3 : 0;
            }
            if (lead >= 0xF0 && lead <= 0xF4)
            {
                auto const lo = lead == 0xF0 ? std::uint8_t{0x90} : std::uint8_t{0x80};
                auto const hi = lead == 0xF4 ? std::uint8_t{0x8F} : std::uint8_t{0xBF};
                return continuation(1, lo, hi) && continuation(2) && continuation(3) ? 4 : 0;
            }
            return 0;
        }

    } // namespace

    auto decode_text(std::span<std::uint8_t const> const data) -> std::string
    {
        std::string text;
        text.reserve(data.size());

        std::size_t pos = 0;
        while (pos < data.size())
        {
            auto const len = sequence_length(data, pos);
            if (len == 0)
            {
                text.append(replacement_character);
                ++pos;
                continue;
            }

            text.append(reinterpret_cast<char const *>(data.data() + pos), len);
            pos += len;
        }

        return text;
    }

    auto split_lines(std::string const &text) -> std::vector<std::string>
    {
        std::vector<std::string> lines;

        std::size_t start = 0;
        while (start < text.size())
        {
            auto const newline = text.find('\n', start);
            if (newline == std::string::npos)
            {
                lines.emplace_back(text.substr(start));
                break;
            }

            lines.emplace_back(text.substr(start, newline - start + 1));
            start = newline + 1;
        }

        return lines;
    }

} // namespace fastssh
