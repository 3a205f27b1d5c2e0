#pragma once

#include <resx/result.hpp>
#include <resx/culture.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace resx {

// Value and comment storage for every resource key of one culture.
// One instance is shared by all entries of the owning entity.
class ResourceLanguage {
public:
    explicit ResourceLanguage(CultureKey culture);

    const CultureKey& culture() const { return culture_; }

    // Missing keys and missing comments read as ""
    std::string get_value(const std::string& key) const;
    std::string get_comment(const std::string& key) const;

    // Return true if the stored data changed
    bool set_value(const std::string& key, const std::string& value);
    bool set_comment(const std::string& key, const std::string& comment);

    bool key_exists(const std::string& key) const;
    bool can_change() const { return !read_only_; }

    // Moves old_key's value and comment to new_key, keeping its position.
    // Succeeds without effect when old_key is not stored in this culture.
    Status rename_key(const std::string& old_key, const std::string& new_key);

    // Stores key with an empty value; false if present or read-only
    bool add_key(const std::string& key);

    // Returns true if the key existed and was removed
    bool remove_key(const std::string& key);

    // Keys in insertion order
    const std::vector<std::string>& keys() const { return order_; }
    size_t size() const { return order_.size(); }

    void set_read_only(bool read_only) { read_only_ = read_only; }
    bool is_read_only() const { return read_only_; }

    void set_neutral(bool neutral) { is_neutral_ = neutral; }
    bool is_neutral() const { return is_neutral_; }

    bool is_modified() const { return modified_; }
    void clear_modified() { modified_ = false; }

private:
    struct Node {
        std::string value;
        std::string comment;
    };

    enum class Field { Value, Comment };

    bool set_field(const std::string& key, const std::string& text, Field field);

    CultureKey culture_;
    std::unordered_map<std::string, Node> nodes_;
    std::vector<std::string> order_;
    bool read_only_ = false;
    bool is_neutral_ = false;
    bool modified_ = false;
};

} // namespace resx
