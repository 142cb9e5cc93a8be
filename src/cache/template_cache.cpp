#include <stencil/cache/TemplateCache.hpp>

namespace stencil::cache {

namespace {

uint64_t fnv1a64(std::string_view s) {
    uint64_t h = 1469598103934665603ull;
    for (const unsigned char c : s) {
        h ^= static_cast<uint64_t>(c);
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace

NodeListPtr TemplateCache::find(std::string_view text) const {
    const uint64_t key = fnv1a64(text);
    std::shared_lock lock(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    for (const auto& e : it->second) {
        if (e.text == text) {
            ++hits_;
            return e.nodes;
        }
    }
    return nullptr;
}

NodeListPtr TemplateCache::get_or_parse(std::string_view text) {
    if (auto hit = find(text)) return hit;

    // Segment outside the lock; concurrent misses only duplicate work.
    auto parsed = std::make_shared<const NodeList>(tmpl::segment_template(text));
    ++misses_;

    const uint64_t key = fnv1a64(text);
    std::unique_lock lock(mu_);
    auto& bucket = entries_[key];
    for (const auto& e : bucket) {
        if (e.text == text) return e.nodes;
    }
    bucket.push_back(Entry{std::string(text), parsed});
    return parsed;
}

size_t TemplateCache::size() const {
    std::shared_lock lock(mu_);
    size_t n = 0;
    for (const auto& [_, bucket] : entries_) n += bucket.size();
    return n;
}

void TemplateCache::clear() {
    std::unique_lock lock(mu_);
    entries_.clear();
}

uint64_t TemplateCache::hits() const {
    return hits_.load();
}

uint64_t TemplateCache::misses() const {
    return misses_.load();
}

} // namespace stencil::cache
