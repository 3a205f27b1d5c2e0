#include <resx/resource_entity.hpp>
#include <resx/log.hpp>
#include <algorithm>
#include <unordered_set>

namespace resx {

ResourceEntity::ResourceEntity(std::string project_name, std::string base_name,
                               Config config)
    : project_name_(std::move(project_name)),
      base_name_(std::move(base_name)),
      config_(std::move(config))
{
    languages_.push_back(std::make_unique<ResourceLanguage>(CultureKey::neutral()));
    languages_.front()->set_neutral(true);
}

Result<ResourceLanguage*> ResourceEntity::add_language(const CultureKey& culture) {
    if (language(culture)) {
        return ResxError{ResxError::DuplicateKey,
            "culture '" + culture.display_name() + "' already exists in " +
            base_name_, "", "", culture.display_name()};
    }

    languages_.push_back(std::make_unique<ResourceLanguage>(culture));
    ResourceLanguage* added = languages_.back().get();

    for (auto& entry : entries_) {
        RESX_TRY(entry->attach_language(added));
    }

    log::debug("%s: added culture '%s'", base_name_.c_str(),
               culture.display_name().c_str());
    return Result<ResourceLanguage*>::ok(added);
}

ResourceLanguage* ResourceEntity::language(const CultureKey& culture) const {
    for (const auto& lang : languages_) {
        if (lang->culture() == culture) return lang.get();
    }
    return nullptr;
}

std::vector<CultureKey> ResourceEntity::cultures() const {
    std::vector<CultureKey> out;
    out.reserve(languages_.size());
    for (const auto& lang : languages_) out.push_back(lang->culture());
    return out;
}

LanguageMap ResourceEntity::language_map() const {
    LanguageMap map;
    for (const auto& lang : languages_) map.add(lang.get());
    return map;
}

Status ResourceEntity::load_entries() {
    entries_.clear();

    std::unordered_set<std::string> seen;
    for (const auto& lang : languages_) {
        for (const auto& key : lang->keys()) {
            if (!seen.insert(key).second) continue;
            auto entry = ResourceEntry::create(*this, key, language_map());
            if (entry.is_err()) return std::move(entry).error();
            entries_.push_back(std::move(entry).value());
        }
    }

    log::info("%s: loaded %zu entries in %zu culture(s)", base_name_.c_str(),
              entries_.size(), languages_.size());
    return ok_status();
}

Result<ResourceEntry*> ResourceEntity::add(const std::string& key) {
    if (key.empty()) {
        return ResxError{ResxError::InvalidArg, "empty resource key"};
    }

    bool exists = find(key) != nullptr;
    for (const auto& lang : languages_) {
        exists = exists || lang->key_exists(key);
    }
    if (exists) {
        return ResxError{ResxError::DuplicateKey,
            "key already exists: " + key, "", key, ""};
    }

    if (!neutral_language().add_key(key)) {
        return ResxError{ResxError::Immutable,
            "neutral culture of " + base_name_ + " cannot be changed",
            "", key, CultureKey::neutral().display_name()};
    }

    auto entry = ResourceEntry::create(*this, key, language_map());
    if (entry.is_err()) return std::move(entry).error();
    entries_.push_back(std::move(entry).value());

    log::debug("%s: added key '%s'", base_name_.c_str(), key.c_str());
    return Result<ResourceEntry*>::ok(entries_.back().get());
}

Status ResourceEntity::remove(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const auto& e) { return e->key() == key; });
    if (it == entries_.end()) {
        return ResxError{ResxError::NotFound,
            "no entry with key '" + key + "'", "", key, ""};
    }

    for (const auto& lang : languages_) {
        if (lang->key_exists(key) && !lang->can_change()) {
            return ResxError{ResxError::Immutable,
                "cannot remove '" + key + "': culture '" +
                lang->culture().display_name() + "' cannot be changed",
                "", key, lang->culture().display_name()};
        }
    }

    for (const auto& lang : languages_) {
        lang->remove_key(key);
    }
    entries_.erase(it);

    log::debug("%s: removed key '%s'", base_name_.c_str(), key.c_str());
    return ok_status();
}

ResourceEntry* ResourceEntity::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry->key() == key) return entry.get();
    }
    return nullptr;
}

std::vector<ResourceEntry*> ResourceEntity::entries() const {
    std::vector<ResourceEntry*> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) out.push_back(entry.get());
    return out;
}

bool ResourceEntity::can_edit(const CultureKey& culture) const {
    auto* lang = language(culture);
    return lang && lang->can_change();
}

bool ResourceEntity::operator==(const ResourceEntity& o) const {
    return project_name_ == o.project_name_ && base_name_ == o.base_name_;
}

size_t ResourceEntity::hash() const {
    return hash_combine(std::hash<std::string>{}(project_name_),
                        std::hash<std::string>{}(base_name_));
}

} // namespace resx
