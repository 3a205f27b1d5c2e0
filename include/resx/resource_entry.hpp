#pragma once

#include <resx/result.hpp>
#include <resx/culture.hpp>
#include <resx/language_map.hpp>
#include <resx/value_projection.hpp>
#include <resx/property_graph.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace resx {

class ResourceEntity;

// A place in source code that uses a resource key. Supplied by an external
// scanner; the entry stores it without interpreting it.
struct CodeReference {
    std::string file;
    int line = 0;
    std::string text;

    bool operator==(const CodeReference& o) const {
        return file == o.file && line == o.line && text == o.text;
    }
};

using CodeReferenceList = std::shared_ptr<const std::vector<CodeReference>>;

// One resource key across all cultures of its owning entity.
//
// Entries are created by ResourceEntity and are neither copyable nor movable:
// projections and listeners refer back to the entry.
class ResourceEntry {
    struct Token {
        explicit Token() = default;
    };

public:
    using PropertyListener = std::function<void(Property)>;

    // InvalidArg if key is empty or languages is empty. The first language
    // in the map becomes the neutral language.
    static Result<std::unique_ptr<ResourceEntry>> create(
        ResourceEntity& owner, const std::string& key, LanguageMap languages);

    // Only reachable through create()
    ResourceEntry(Token, ResourceEntity& owner, std::string key,
                  LanguageMap languages);
    ~ResourceEntry();

    ResourceEntry(const ResourceEntry&) = delete;
    ResourceEntry& operator=(const ResourceEntry&) = delete;

    ResourceEntity& owner() const { return owner_; }
    const std::string& key() const { return key_; }

    // Renames the key in every culture.
    //
    // Fails with DuplicateKey if any culture already stores new_key, or with
    // Immutable if any culture cannot change; nothing is modified then, but
    // observers still receive a Key notification so bound views re-read the
    // (unchanged) key. A notification alone does not mean the rename took
    // effect; check the returned status. Renaming to the current key is a
    // no-op that notifies nothing.
    Status set_key(const std::string& new_key);

    // Neutral culture comment, "" when none
    std::string comment() const;
    // Writes the neutral culture comment only
    Status set_comment(const std::string& comment);

    const LanguageMap& languages() const { return languages_; }
    const CultureKey& neutral_culture() const;
    ResourceLanguage& neutral_language() const { return *neutral_language_; }

    // Projections are replaced by a successful set_key() or attach_language();
    // references obtained earlier must not be used afterwards.
    ValueProjection<std::string>& values() { return *values_; }
    const ValueProjection<std::string>& values() const { return *values_; }
    ValueProjection<std::string>& comments() { return *comments_; }
    const ValueProjection<std::string>& comments() const { return *comments_; }
    const ValueProjection<bool>& file_exists() const { return *file_exists_; }
    const ValueProjection<std::string>& errors() const { return *errors_; }

    bool is_invariant() const;
    Status set_invariant(bool invariant);

    bool has_format_parameter_mismatch() const;
    // Same check restricted to the given cultures; NotFound for an unknown
    // one. Invariant entries report no mismatch here either.
    Result<bool> has_format_parameter_mismatch(
        const std::vector<CultureKey>& cultures) const;

    const CodeReferenceList& code_references() const { return code_references_; }
    void set_code_references(CodeReferenceList references);

    bool can_edit(const CultureKey& culture) const;

    // Notifies Values and Comment (and their dependents) without a change.
    // A listener may remove this entry from its owner; dispatch stops there.
    void refresh();

    // Adds a culture the owner created after this entry; rebuilds projections
    Status attach_language(ResourceLanguage* language);

    size_t subscribe(PropertyListener listener);
    void unsubscribe(size_t id);

    bool operator==(const ResourceEntry& o) const;
    bool operator!=(const ResourceEntry& o) const { return !(*this == o); }
    size_t hash() const;

    struct Hash {
        size_t operator()(const ResourceEntry& e) const { return e.hash(); }
    };

private:
    void reset_projections();
    std::string error_text(const ResourceLanguage& language) const;
    std::vector<std::string> all_values() const;

    void on_property_changed(Property p);
    void notify(Property p);

    ResourceEntity& owner_;
    std::string key_;
    LanguageMap languages_;
    ResourceLanguage* neutral_language_;

    std::shared_ptr<ValueProjection<std::string>> values_;
    std::shared_ptr<ValueProjection<std::string>> comments_;
    std::shared_ptr<ValueProjection<bool>> file_exists_;
    std::shared_ptr<ValueProjection<std::string>> errors_;

    CodeReferenceList code_references_;

    std::vector<std::pair<size_t, PropertyListener>> listeners_;
    size_t next_listener_id_ = 1;

    // Cleared by the destructor; dispatch loops hold a copy
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace resx
