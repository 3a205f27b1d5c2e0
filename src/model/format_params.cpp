#include <resx/format_params.hpp>
#include <utility>
#include <cctype>

namespace resx {

const char* const kFormatParameterMismatchError = "format parameter mismatch";

void ParameterMask::set(uint32_t index) {
    size_t word = index / 64;
    if (word >= words_.size()) {
        words_.resize(word + 1, 0);
    }
    words_[word] |= uint64_t{1} << (index % 64);
}

bool ParameterMask::test(uint32_t index) const {
    size_t word = index / 64;
    if (word >= words_.size()) return false;
    return (words_[word] >> (index % 64)) & 1u;
}

size_t ParameterMask::count() const {
    size_t n = 0;
    for (uint64_t w : words_) {
        while (w) {
            w &= w - 1;
            ++n;
        }
    }
    return n;
}

std::string ParameterMask::to_string() const {
    std::string out = "{";
    bool first = true;
    for (size_t word = 0; word < words_.size(); ++word) {
        for (unsigned bit = 0; bit < 64; ++bit) {
            if (!((words_[word] >> bit) & 1u)) continue;
            if (!first) out += ",";
            out += std::to_string(word * 64 + bit);
            first = false;
        }
    }
    out += "}";
    return out;
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Tries to read one placeholder starting at text[pos] == '{'.
// On success stores the index and returns the position after '}'.
static size_t scan_placeholder(const std::string& text, size_t pos, uint32_t& index) {
    size_t i = pos + 1;
    size_t n = text.size();

    uint64_t value = 0;
    size_t digits_start = i;
    while (i < n && is_digit(text[i])) {
        if (value <= kMaxParameterIndex) {
            value = value * 10 + static_cast<uint64_t>(text[i] - '0');
        }
        ++i;
    }
    if (i == digits_start) return 0;

    // alignment
    if (i < n && text[i] == ',') {
        size_t j = i + 1;
        if (j < n && text[j] == '-') ++j;
        size_t align_start = j;
        while (j < n && is_digit(text[j])) ++j;
        if (j == align_start) return 0;
        i = j;
    }

    // format spec
    if (i < n && text[i] == ':') {
        size_t j = i + 1;
        while (j < n && text[j] != '}' &&
               !std::isspace(static_cast<unsigned char>(text[j]))) {
            ++j;
        }
        if (j == i + 1) return 0;
        i = j;
    }

    if (i >= n || text[i] != '}') return 0;
    if (value > kMaxParameterIndex) return 0;

    index = static_cast<uint32_t>(value);
    return i + 1;
}

ParameterMask format_parameters(const std::string& text) {
    ParameterMask mask;
    size_t pos = 0;
    while ((pos = text.find('{', pos)) != std::string::npos) {
        uint32_t index = 0;
        size_t next = scan_placeholder(text, pos, index);
        if (next) {
            mask.set(index);
            pos = next;
        } else {
            ++pos;
        }
    }
    return mask;
}

bool has_format_parameter_mismatch(const std::vector<std::string>& values) {
    bool have_first = false;
    ParameterMask first;
    for (const auto& value : values) {
        if (value.empty()) continue;
        auto mask = format_parameters(value);
        if (!have_first) {
            first = std::move(mask);
            have_first = true;
        } else if (mask != first) {
            return true;
        }
    }
    return false;
}

std::string format_parameter_error(const std::string& neutral_value,
                                   const std::string& value) {
    if (value.empty() || neutral_value.empty()) return "";
    if (format_parameters(neutral_value) != format_parameters(value)) {
        return kFormatParameterMismatchError;
    }
    return "";
}

} // namespace resx
