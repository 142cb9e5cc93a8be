#pragma once

#include <string>
#include <string_view>

namespace stencil::os {

struct ReadTextResult {
    bool ok = false;
    std::string text{};
    std::string err{};
};

ReadTextResult read_text_file(std::string_view path);

} // namespace stencil::os
