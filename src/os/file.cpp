#include <stencil/os/File.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace stencil::os {

ReadTextResult read_text_file(std::string_view path) {
    ReadTextResult r{};

    std::ifstream in{std::string(path), std::ios::binary};
    if (!in) {
        r.err = "cannot open '" + std::string(path) + "': " + std::strerror(errno);
        return r;
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        r.err = "read failed: '" + std::string(path) + "'";
        return r;
    }

    r.text = buf.str();
    r.ok = true;
    return r;
}

} // namespace stencil::os
