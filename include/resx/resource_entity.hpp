#pragma once

#include <resx/result.hpp>
#include <resx/config.hpp>
#include <resx/culture.hpp>
#include <resx/resource_language.hpp>
#include <resx/resource_entry.hpp>
#include <memory>
#include <string>
#include <vector>

namespace resx {

// A set of resource files sharing one base name within a project, e.g.
// Resources.resx, Resources.de.resx, Resources.fr.resx. Owns one
// ResourceLanguage per culture and one ResourceEntry per key.
class ResourceEntity {
public:
    // The neutral language is created immediately
    ResourceEntity(std::string project_name, std::string base_name,
                   Config config = Config{});

    ResourceEntity(const ResourceEntity&) = delete;
    ResourceEntity& operator=(const ResourceEntity&) = delete;

    const std::string& project_name() const { return project_name_; }
    const std::string& base_name() const { return base_name_; }
    const Config& config() const { return config_; }

    // Creates the language and attaches it to every existing entry.
    // DuplicateKey if the culture is already present.
    Result<ResourceLanguage*> add_language(const CultureKey& culture);

    // nullptr if the culture is not present
    ResourceLanguage* language(const CultureKey& culture) const;
    ResourceLanguage& neutral_language() const { return *languages_.front(); }
    std::vector<CultureKey> cultures() const;
    LanguageMap language_map() const;

    // Rebuilds the entry list from the keys stored in the languages, neutral
    // language first, then in key order within each language.
    Status load_entries();

    // Creates an entry for a key that no culture stores yet
    Result<ResourceEntry*> add(const std::string& key);

    // Removes the key from every culture and discards its entry
    Status remove(const std::string& key);

    // nullptr if no entry has that key
    ResourceEntry* find(const std::string& key) const;
    std::vector<ResourceEntry*> entries() const;
    size_t entry_count() const { return entries_.size(); }

    // The culture exists and its language accepts changes
    bool can_edit(const CultureKey& culture) const;

    bool operator==(const ResourceEntity& o) const;
    bool operator!=(const ResourceEntity& o) const { return !(*this == o); }
    size_t hash() const;

private:
    std::string project_name_;
    std::string base_name_;
    Config config_;
    std::vector<std::unique_ptr<ResourceLanguage>> languages_;
    std::vector<std::unique_ptr<ResourceEntry>> entries_;
};

// Combines hashes the way boost::hash_combine does
inline size_t hash_combine(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

} // namespace resx
