#include <resx/resource_language.hpp>
#include <resx/log.hpp>
#include <algorithm>

namespace resx {

ResourceLanguage::ResourceLanguage(CultureKey culture)
    : culture_(std::move(culture)) {}

std::string ResourceLanguage::get_value(const std::string& key) const {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) return "";
    return it->second.value;
}

std::string ResourceLanguage::get_comment(const std::string& key) const {
    auto it = nodes_.find(key);
    if (it == nodes_.end()) return "";
    return it->second.comment;
}

bool ResourceLanguage::set_value(const std::string& key, const std::string& value) {
    return set_field(key, value, Field::Value);
}

bool ResourceLanguage::set_comment(const std::string& key, const std::string& comment) {
    return set_field(key, comment, Field::Comment);
}

bool ResourceLanguage::set_field(const std::string& key, const std::string& text,
                                 Field field) {
    if (read_only_) {
        log::warn("culture '%s' is read-only, ignoring write to '%s'",
                  culture_.display_name().c_str(), key.c_str());
        return false;
    }

    auto it = nodes_.find(key);
    if (it == nodes_.end()) {
        // An empty write to a key this culture never stored is not a change
        if (text.empty()) return false;
        it = nodes_.emplace(key, Node{}).first;
        order_.push_back(key);
    }

    std::string& slot = field == Field::Value ? it->second.value : it->second.comment;
    if (slot == text) return false;

    slot = text;
    modified_ = true;
    return true;
}

bool ResourceLanguage::key_exists(const std::string& key) const {
    return nodes_.count(key) > 0;
}

Status ResourceLanguage::rename_key(const std::string& old_key,
                                    const std::string& new_key) {
    if (read_only_) {
        return ResxError{ResxError::Immutable,
            "culture '" + culture_.display_name() + "' is read-only",
            "", old_key, culture_.display_name()};
    }

    auto it = nodes_.find(old_key);
    if (it == nodes_.end() || old_key == new_key) {
        return ok_status();
    }

    if (nodes_.count(new_key)) {
        return ResxError{ResxError::DuplicateKey,
            "key already exists: " + new_key,
            "", new_key, culture_.display_name()};
    }

    Node node = std::move(it->second);
    nodes_.erase(it);
    nodes_.emplace(new_key, std::move(node));
    std::replace(order_.begin(), order_.end(), old_key, new_key);

    modified_ = true;
    return ok_status();
}

bool ResourceLanguage::add_key(const std::string& key) {
    if (read_only_ || nodes_.count(key)) return false;
    nodes_.emplace(key, Node{});
    order_.push_back(key);
    modified_ = true;
    return true;
}

bool ResourceLanguage::remove_key(const std::string& key) {
    if (read_only_) {
        log::warn("culture '%s' is read-only, cannot remove '%s'",
                  culture_.display_name().c_str(), key.c_str());
        return false;
    }

    if (nodes_.erase(key) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    modified_ = true;
    return true;
}

} // namespace resx
