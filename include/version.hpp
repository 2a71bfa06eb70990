#ifndef HUNTGLITCH_VERSION_HPP
#define HUNTGLITCH_VERSION_HPP

#define HGL_VERSION "1.0.0"

namespace hgl {

/// Library version string.
inline constexpr const char *kVersion = HGL_VERSION;

} // namespace hgl

#endif // HUNTGLITCH_VERSION_HPP
