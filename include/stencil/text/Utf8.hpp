#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::text {

// Length of the well-formed UTF-8 sequence starting at `i`, or 0 when the
// bytes there are not one.
std::size_t utf8_sequence_length(std::string_view s, std::size_t i);

// Splits into code points. Bytes that are not part of a well-formed
// sequence come out as one-byte strings.
std::vector<std::string> split_chars(std::string_view s);

} // namespace stencil::text
