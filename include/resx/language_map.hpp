#pragma once

#include <resx/culture.hpp>
#include <resx/resource_language.hpp>
#include <utility>
#include <vector>

namespace resx {

// Ordered culture -> language handles. The first language is the neutral
// one. Handles are non-owning; the owning entity keeps the languages alive.
class LanguageMap {
public:
    using Item = std::pair<CultureKey, ResourceLanguage*>;
    using const_iterator = std::vector<Item>::const_iterator;

    // Returns false if the culture is already mapped or language is null
    bool add(ResourceLanguage* language) {
        if (!language || contains(language->culture())) return false;
        items_.emplace_back(language->culture(), language);
        return true;
    }

    ResourceLanguage* find(const CultureKey& culture) const {
        for (const auto& item : items_) {
            if (item.first == culture) return item.second;
        }
        return nullptr;
    }

    bool contains(const CultureKey& culture) const { return find(culture) != nullptr; }

    ResourceLanguage* neutral() const {
        return items_.empty() ? nullptr : items_.front().second;
    }

    std::vector<CultureKey> cultures() const {
        std::vector<CultureKey> out;
        out.reserve(items_.size());
        for (const auto& item : items_) out.push_back(item.first);
        return out;
    }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

private:
    std::vector<Item> items_;
};

} // namespace resx
