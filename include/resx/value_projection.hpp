#pragma once

#include <resx/result.hpp>
#include <resx/language_map.hpp>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace resx {

// ---------------------------------------------------------------------------
// ValueProjection<T>: one logical attribute viewed across every culture
// ---------------------------------------------------------------------------
//
// Values are produced on demand by the getter; nothing is cached. A set()
// that the store reports as a change raises ValueChanged once, synchronously.
// A projection constructed without a setter is read-only.

template<typename T>
class ValueProjection : public std::enable_shared_from_this<ValueProjection<T>> {
public:
    using Getter = std::function<T(const ResourceLanguage&)>;
    using Setter = std::function<bool(ResourceLanguage&, const T&)>;
    using Listener = std::function<void()>;

    ValueProjection(LanguageMap languages, Getter getter, Setter setter = nullptr)
        : languages_(std::move(languages)),
          getter_(std::move(getter)),
          setter_(std::move(setter)) {}

    ValueProjection(const ValueProjection&) = delete;
    ValueProjection& operator=(const ValueProjection&) = delete;

    Result<T> get(const CultureKey& culture) const {
        auto* language = languages_.find(culture);
        if (!language) {
            return not_found(culture);
        }
        return Result<T>::ok(getter_(*language));
    }

    // Returns whether the underlying store changed
    Result<bool> set(const CultureKey& culture, const T& value) {
        auto* language = languages_.find(culture);
        if (!language) {
            return not_found(culture);
        }
        if (!setter_) {
            return ResxError{ResxError::Immutable,
                "projection is read-only", "", "", culture.display_name()};
        }

        if (!setter_(*language, value)) {
            return Result<bool>::ok(false);
        }

        // A listener may drop the last owner of this projection
        auto guard = this->weak_from_this().lock();
        raise_value_changed();
        return Result<bool>::ok(true);
    }

    std::vector<std::pair<CultureKey, T>> items() const {
        std::vector<std::pair<CultureKey, T>> out;
        out.reserve(languages_.size());
        for (const auto& [culture, language] : languages_) {
            out.emplace_back(culture, getter_(*language));
        }
        return out;
    }

    const LanguageMap& languages() const { return languages_; }
    bool is_read_only() const { return !setter_; }

    size_t subscribe(Listener listener) {
        size_t id = next_listener_id_++;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    void unsubscribe(size_t id) {
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
            if (it->first == id) {
                listeners_.erase(it);
                return;
            }
        }
    }

private:
    static ResxError not_found(const CultureKey& culture) {
        return ResxError{ResxError::NotFound,
            "culture '" + culture.display_name() + "' is not part of this entry",
            "cultures must be added through the owning entity",
            "", culture.display_name()};
    }

    void raise_value_changed() {
        // Copy so listeners may subscribe or unsubscribe while being notified
        auto listeners = listeners_;
        for (auto& [id, listener] : listeners) {
            listener();
        }
    }

    LanguageMap languages_;
    Getter getter_;
    Setter setter_;
    std::vector<std::pair<size_t, Listener>> listeners_;
    size_t next_listener_id_ = 1;
};

} // namespace resx
