#ifndef SCRIPTUM_VERSION_HPP
#define SCRIPTUM_VERSION_HPP

// ============================================================================
// Scriptum - Version Header
// ============================================================================

namespace scriptum {

inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;

inline constexpr const char* VERSION_STRING = "1.0.0";

} // namespace scriptum

#endif // SCRIPTUM_VERSION_HPP
