#include <resx/culture.hpp>
#include <algorithm>
#include <cctype>

namespace resx {

Result<CultureKey> CultureKey::parse(const std::string& name) {
    CultureKey key;
    if (name.empty()) {
        return Result<CultureKey>::ok(key);
    }

    bool segment_empty = true;
    for (char c : name) {
        if (c == '-' || c == '_') {
            if (segment_empty) {
                return ResxError{ResxError::InvalidArg,
                    "invalid culture name '" + name + "'",
                    "empty segment; expected a tag like 'en-US'"};
            }
            segment_empty = true;
        } else if (std::isalnum(static_cast<unsigned char>(c))) {
            segment_empty = false;
        } else {
            return ResxError{ResxError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in culture name '" + name + "'",
                "allowed: [A-Za-z0-9] separated by '-' or '_'"};
        }
    }
    if (segment_empty) {
        return ResxError{ResxError::InvalidArg,
            "invalid culture name '" + name + "'",
            "culture names cannot end with a separator"};
    }

    key.name_ = name;
    std::replace(key.name_.begin(), key.name_.end(), '_', '-');
    key.folded_ = key.name_;
    std::transform(key.folded_.begin(), key.folded_.end(), key.folded_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return Result<CultureKey>::ok(std::move(key));
}

std::string CultureKey::display_name() const {
    if (is_neutral()) return "neutral";
    return name_;
}

size_t CultureKey::hash() const {
    return std::hash<std::string>{}(folded_);
}

} // namespace resx
