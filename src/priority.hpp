#pragma once

#include <string>

using Priority = int;

inline constexpr Priority PRIORITY_DEFAULT = 500;
inline constexpr Priority PRIORITY_CANARY = 1000;
inline constexpr Priority PRIORITY_PIN = 1500;
inline constexpr Priority PRIORITY_ROLLBACK = 1500;

// Accepts an integer or one of Default, Canary, Pin, Rollback (any case).
// Throws ParseError.
Priority parse_priority(const std::string& text);

// Name of a well-known priority, or its decimal value.
std::string priority_to_string(Priority p);
