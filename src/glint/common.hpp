#pragma once

#include <vector>
#include <string>
#include <stdexcept>
#include <sstream>

#define GLINT_ASSERT(EXPR)                                          \
  if(!static_cast<bool>(EXPR)) {                                    \
    std::ostringstream ostream;                                     \
    ostream << "[" << __FILE__ << ":" << __LINE__ << "] " << #EXPR; \
    throw std::runtime_error{ostream.str()};                        \
  }                                                                 \


namespace glint {

//
// Error taxonomy
//
// - ConfigError:       invalid render parameters (rejected before any work starts)
// - ConstructionError: invalid scene geometry (scene / bvh build)
// - RenderError:       fault confined to a single tile while rendering
//

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ConstructionError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct RenderError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace glint


// Overload stream operator for std containers
namespace std {

template<typename T>
inline std::ostream& operator<<(std::ostream& os, const std::vector<T>& v) {
  os << "{";
  for (size_t i = 0; i < v.size(); i++) {
    if (i > 0) os << ", ";
    os << v[i];
  }
  os << "}";
  return os;
}

} // namespace std
