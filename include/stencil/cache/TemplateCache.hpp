#pragma once

#include <stencil/tmpl/Segmenter.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stencil::cache {

using NodeList = std::vector<tmpl::TemplateNode>;
using NodeListPtr = std::shared_ptr<const NodeList>;

/// Segmented templates keyed by their raw text. Entries are immutable once
/// published, so readers share them without copying. Two threads missing on
/// the same text may both segment it; the first insert wins.
class TemplateCache {
public:
    NodeListPtr get_or_parse(std::string_view text);
    NodeListPtr find(std::string_view text) const;

    size_t size() const;
    void clear();

    uint64_t hits() const;
    uint64_t misses() const;

private:
    struct Entry {
        std::string text{};
        NodeListPtr nodes{};
    };

    // FNV-1a of the text -> entries with that hash
    std::unordered_map<uint64_t, std::vector<Entry>> entries_{};
    mutable std::shared_mutex mu_{};
    mutable std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace stencil::cache
