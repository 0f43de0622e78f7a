#include "priority.hpp"

#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <charconv>
#include <map>

namespace {
    const std::map<std::string, Priority, std::less<>> named_priorities = {
        {"default", PRIORITY_DEFAULT},
        {"canary", PRIORITY_CANARY},
        {"pin", PRIORITY_PIN},
        {"rollback", PRIORITY_ROLLBACK},
    };
}

Priority parse_priority(const std::string& text) {
    const std::string t = trim(text);
    if (auto it = named_priorities.find(to_lower(t)); it != named_priorities.end()) {
        return it->second;
    }
    Priority value = 0;
    const char* begin = t.data();
    const char* end = t.data() + t.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (t.empty() || ec != std::errc() || ptr != end) {
        throw GoogetException(string_format("error.invalid_priority", text), ErrorKind::ParseError);
    }
    return value;
}

std::string priority_to_string(Priority p) {
    switch (p) {
        case PRIORITY_DEFAULT: return "Default";
        case PRIORITY_CANARY: return "Canary";
        // Pin and Rollback share a value.
        case PRIORITY_PIN: return "Pin";
        default: return std::to_string(p);
    }
}
