#pragma once

#include <resx/result.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace resx {

// Culture identity: the neutral (invariant) culture or a tag such as
// "de", "en-US" or "zh-Hans-CN". Tags compare case-insensitively.
class CultureKey {
public:
    CultureKey() = default;

    static CultureKey neutral() { return CultureKey(); }

    // Accepts "" (neutral) or [A-Za-z0-9]+ segments joined by '-' or '_'
    static Result<CultureKey> parse(const std::string& name);

    bool is_neutral() const { return name_.empty(); }

    // Tag as given to parse(), with '_' normalized to '-'
    const std::string& name() const { return name_; }

    // "neutral" for the invariant culture, otherwise name()
    std::string display_name() const;

    size_t hash() const;

    bool operator==(const CultureKey& o) const { return folded_ == o.folded_; }
    bool operator!=(const CultureKey& o) const { return !(*this == o); }
    // Neutral sorts first, then tags in case-insensitive order
    bool operator<(const CultureKey& o) const { return folded_ < o.folded_; }

private:
    std::string name_;
    std::string folded_;
};

} // namespace resx

namespace std {
template<>
struct hash<resx::CultureKey> {
    size_t operator()(const resx::CultureKey& c) const { return c.hash(); }
};
} // namespace std
