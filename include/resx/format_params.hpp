#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace resx {

// Highest placeholder index recognized; "{70000}" is plain text.
constexpr uint32_t kMaxParameterIndex = 65535;

// Set of positional placeholder indices found in a string: bit N is set
// iff "{N}" (with optional ",align" / ":format") appears at least once.
class ParameterMask {
public:
    void set(uint32_t index);
    bool test(uint32_t index) const;
    size_t count() const;
    bool empty() const { return words_.empty(); }

    // e.g. "{0,2}"; "{}" when no placeholder is present
    std::string to_string() const;

    bool operator==(const ParameterMask& o) const { return words_ == o.words_; }
    bool operator!=(const ParameterMask& o) const { return !(*this == o); }

private:
    // No trailing zero words, so equal sets compare equal
    std::vector<uint64_t> words_;
};

// Scans text for {digits[,[-]digits][:spec]} where spec is one or more
// characters that are neither whitespace nor '}'.
ParameterMask format_parameters(const std::string& text);

// True if the non-empty strings carry more than one distinct placeholder
// set. Empty strings are skipped: a missing translation is not a mismatch.
bool has_format_parameter_mismatch(const std::vector<std::string>& values);

// Error text for a translated value checked against the neutral value, or
// "" when there is nothing to report (either side empty, or same placeholders).
std::string format_parameter_error(const std::string& neutral_value,
                                   const std::string& value);

extern const char* const kFormatParameterMismatchError;

} // namespace resx
