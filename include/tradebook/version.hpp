#pragma once

namespace tradebook {

// Semantic versioning for the library
inline constexpr int version_major = 1;
inline constexpr int version_minor = 1;
inline constexpr int version_patch = 0;

inline constexpr const char* version_string = "1.1.0";

} // namespace tradebook
