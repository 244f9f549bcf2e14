#ifndef SEMQ_VERSION_HPP
#define SEMQ_VERSION_HPP

#include <string>

namespace semq
{

// Kept in step with project(semq VERSION ...) in CMakeLists.txt
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// "MAJOR.MINOR.PATCH"
inline std::string version_string()
{
    return std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace semq

#endif // SEMQ_VERSION_HPP
