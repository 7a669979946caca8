#pragma once

// text.hpp - permissive decoding of remote output

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace fastssh
{

    // UTF-8 decode that never fails: each malformed sequence becomes U+FFFD
    [[nodiscard]] auto decode_text(std::span<std::uint8_t const> data) -> std::string;

    // splits after every '\n', keeping the terminator; a trailing partial line is kept as is
    [[nodiscard]] auto split_lines(std::string const &text) -> std::vector<std::string>;

} // namespace fastssh
