#include <resx/resource_entry.hpp>
#include <resx/resource_entity.hpp>
#include <resx/format_params.hpp>
#include <resx/log.hpp>
#include <algorithm>
#include <cctype>

namespace resx {

// ASCII case-insensitive substring search
static size_t find_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    auto it = std::search(haystack.begin(), haystack.end(),
                          needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    if (it == haystack.end()) return std::string::npos;
    return static_cast<size_t>(it - haystack.begin());
}

Result<std::unique_ptr<ResourceEntry>> ResourceEntry::create(
    ResourceEntity& owner, const std::string& key, LanguageMap languages)
{
    if (key.empty()) {
        return ResxError{ResxError::InvalidArg, "empty resource key",
            "", "", ""};
    }
    if (languages.empty()) {
        return ResxError{ResxError::InvalidArg,
            "resource entry needs at least one culture",
            "the first culture of the map is the neutral one", key, ""};
    }
    return Result<std::unique_ptr<ResourceEntry>>::ok(
        std::make_unique<ResourceEntry>(Token{}, owner, key, std::move(languages)));
}

ResourceEntry::ResourceEntry(Token, ResourceEntity& owner, std::string key,
                             LanguageMap languages)
    : owner_(owner),
      key_(std::move(key)),
      languages_(std::move(languages)),
      neutral_language_(languages_.neutral())
{
    for (const auto& [culture, language] : languages_) {
        language->set_neutral(language == neutral_language_);
    }
    reset_projections();
}

ResourceEntry::~ResourceEntry() {
    *alive_ = false;
}

void ResourceEntry::reset_projections() {
    // Getters and setters capture the key by value, so every rename
    // replaces the projections instead of patching them.
    const std::string key = key_;

    auto values = std::make_shared<ValueProjection<std::string>>(
        languages_,
        [key](const ResourceLanguage& lang) { return lang.get_value(key); },
        [key](ResourceLanguage& lang, const std::string& v) {
            return lang.set_value(key, v);
        });
    values->subscribe([this] { on_property_changed(Property::Values); });

    auto comments = std::make_shared<ValueProjection<std::string>>(
        languages_,
        [key](const ResourceLanguage& lang) { return lang.get_comment(key); },
        [key](ResourceLanguage& lang, const std::string& v) {
            return lang.set_comment(key, v);
        });
    comments->subscribe([this] { on_property_changed(Property::Comment); });

    values_ = std::move(values);
    comments_ = std::move(comments);

    file_exists_ = std::make_shared<ValueProjection<bool>>(
        languages_, [](const ResourceLanguage&) { return true; });
    errors_ = std::make_shared<ValueProjection<std::string>>(
        languages_,
        [this](const ResourceLanguage& lang) { return error_text(lang); });
}

Status ResourceEntry::set_key(const std::string& new_key) {
    if (new_key.empty()) {
        return ResxError{ResxError::InvalidArg, "empty resource key",
            "", key_, ""};
    }
    if (new_key == key_) {
        return ok_status();
    }

    // Validate every culture before touching any of them
    ResourceEntry* existing = owner_.find(new_key);
    bool duplicate = existing != nullptr && existing != this;
    for (const auto& [culture, language] : languages_) {
        if (language->key_exists(new_key)) {
            duplicate = true;
            break;
        }
    }
    if (duplicate) {
        log::debug("rename '%s' -> '%s' rejected: key exists",
                   key_.c_str(), new_key.c_str());
        ResxError err{ResxError::DuplicateKey,
            "key already exists: " + new_key,
            "choose a key that is not used in " + owner_.base_name(),
            new_key, ""};
        notify(Property::Key);
        return err;
    }

    for (const auto& [culture, language] : languages_) {
        if (!language->can_change()) {
            log::debug("rename '%s' -> '%s' rejected: culture '%s' is read-only",
                       key_.c_str(), new_key.c_str(),
                       culture.display_name().c_str());
            ResxError err{ResxError::Immutable,
                "cannot rename '" + key_ + "': culture '" +
                culture.display_name() + "' cannot be changed",
                "make the resource file writable and retry",
                key_, culture.display_name()};
            notify(Property::Key);
            return err;
        }
    }

    std::vector<ResourceLanguage*> renamed;
    renamed.reserve(languages_.size());
    for (const auto& [culture, language] : languages_) {
        auto status = language->rename_key(key_, new_key);
        if (status.is_err()) {
            // rename_key only fails on a duplicate or a read-only culture,
            // both rejected above. Undo the cultures already renamed.
            for (auto it = renamed.rbegin(); it != renamed.rend(); ++it) {
                auto undo = (*it)->rename_key(new_key, key_);
                if (undo.is_err()) {
                    log::error("rollback of '%s' failed: %s", key_.c_str(),
                               undo.error().format().c_str());
                }
            }
            ResxError err = std::move(status).error();
            notify(Property::Key);
            return err;
        }
        renamed.push_back(language);
    }

    log::debug("renamed '%s' -> '%s' in %zu culture(s)",
               key_.c_str(), new_key.c_str(), languages_.size());
    key_ = new_key;
    reset_projections();
    on_property_changed(Property::Key);
    return ok_status();
}

const CultureKey& ResourceEntry::neutral_culture() const {
    return languages_.begin()->first;
}

std::string ResourceEntry::comment() const {
    return neutral_language_->get_comment(key_);
}

Status ResourceEntry::set_comment(const std::string& comment) {
    if (!neutral_language_->can_change()) {
        return ResxError{ResxError::Immutable,
            "neutral culture cannot be changed",
            "", key_, neutral_culture().display_name()};
    }
    // Goes through the projection so the Comment notification fires once
    auto r = comments_->set(neutral_culture(), comment);
    if (r.is_err()) return std::move(r).error();
    return ok_status();
}

bool ResourceEntry::is_invariant() const {
    const auto& marker = owner_.config().entry.invariant_marker;
    return find_ci(comment(), marker) != std::string::npos;
}

Status ResourceEntry::set_invariant(bool invariant) {
    const auto& marker = owner_.config().entry.invariant_marker;

    if (invariant) {
        if (is_invariant()) return ok_status();
        return set_comment(comment() + marker);
    }

    std::string text = comment();
    size_t index;
    while ((index = find_ci(text, marker)) != std::string::npos) {
        text.erase(index, marker.size());
    }
    return set_comment(text);
}

bool ResourceEntry::has_format_parameter_mismatch() const {
    if (!owner_.config().validation.format_parameters) return false;
    if (is_invariant()) return false;
    return resx::has_format_parameter_mismatch(all_values());
}

Result<bool> ResourceEntry::has_format_parameter_mismatch(
    const std::vector<CultureKey>& cultures) const
{
    std::vector<std::string> subset;
    subset.reserve(cultures.size());
    for (const auto& culture : cultures) {
        auto v = values_->get(culture);
        if (v.is_err()) return std::move(v).error();
        subset.push_back(std::move(v).value());
    }

    if (!owner_.config().validation.format_parameters || is_invariant()) {
        return Result<bool>::ok(false);
    }
    return Result<bool>::ok(resx::has_format_parameter_mismatch(subset));
}

void ResourceEntry::set_code_references(CodeReferenceList references) {
    if (references == code_references_) return;
    code_references_ = std::move(references);
    on_property_changed(Property::CodeReferences);
}

bool ResourceEntry::can_edit(const CultureKey& culture) const {
    return owner_.can_edit(culture);
}

void ResourceEntry::refresh() {
    auto alive = alive_;
    on_property_changed(Property::Values);
    if (*alive) on_property_changed(Property::Comment);
}

Status ResourceEntry::attach_language(ResourceLanguage* language) {
    if (!language) {
        return ResxError{ResxError::InvalidArg, "null language", "", key_, ""};
    }
    if (!languages_.add(language)) {
        return ResxError{ResxError::DuplicateKey,
            "culture '" + language->culture().display_name() +
            "' is already part of this entry",
            "", key_, language->culture().display_name()};
    }
    language->set_neutral(false);
    reset_projections();
    refresh();
    return ok_status();
}

std::string ResourceEntry::error_text(const ResourceLanguage& language) const {
    if (&language == neutral_language_) return "";
    if (!owner_.config().validation.format_parameters) return "";

    return format_parameter_error(neutral_language_->get_value(key_),
                                  language.get_value(key_));
}

std::vector<std::string> ResourceEntry::all_values() const {
    std::vector<std::string> out;
    out.reserve(languages_.size());
    for (auto& item : values_->items()) {
        out.push_back(std::move(item.second));
    }
    return out;
}

size_t ResourceEntry::subscribe(PropertyListener listener) {
    size_t id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void ResourceEntry::unsubscribe(size_t id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [id](const auto& l) { return l.first == id; }),
        listeners_.end());
}

void ResourceEntry::on_property_changed(Property p) {
    // A listener may destroy this entry through its owner
    auto alive = alive_;
    for (Property affected : PropertyGraph::entry_defaults().affected(p)) {
        if (!*alive) return;
        notify(affected);
    }
}

void ResourceEntry::notify(Property p) {
    auto alive = alive_;
    auto listeners = listeners_;
    for (auto& listener : listeners) {
        if (!*alive) return;
        listener.second(p);
    }
}

bool ResourceEntry::operator==(const ResourceEntry& o) const {
    if (this == &o) return true;
    return owner_ == o.owner_ && key_ == o.key_;
}

size_t ResourceEntry::hash() const {
    return hash_combine(owner_.hash(), std::hash<std::string>{}(key_));
}

} // namespace resx
