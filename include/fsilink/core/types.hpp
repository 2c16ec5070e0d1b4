#pragma once

#include <cstddef>
#include <cstdint>
#include <array>
#include <span>
#include <type_traits>

namespace fsl {

// ============================================================================
// Precision Types
// ============================================================================

#ifdef FSILINK_REAL
using Real = FSILINK_REAL;
#else
using Real = double;  // Default to double precision
#endif

// Integer types
using Index = std::size_t;
using Int = std::int32_t;
using Int64 = std::int64_t;
using GlobalIndex = std::uint64_t;  // Counts reduced over all partitions

// ============================================================================
// Vector Types
// ============================================================================

template<typename T, std::size_t N>
using Array = std::array<T, N>;

template<typename T>
using Vec3 = Array<T, 3>;

using Vec3r = Vec3<Real>;

// Interface fields are stored interlaced: 3 reals per entity
inline constexpr Index vec3_stride = 3;

// ============================================================================
// Borrowed Views
// ============================================================================

// Non-owning views handed across component boundaries
template<typename T>
using Span = std::span<T>;

template<typename T>
using ConstSpan = std::span<const T>;

// ============================================================================
// Enumeration Types
// ============================================================================

/**
 * @brief Mesh location of an interface field
 */
enum class InterfaceLocation {
    Face,
    Vertex
};

/**
 * @brief Coupling scheme, selected from the sub-iteration bound
 */
enum class CouplingScheme {
    Explicit,   ///< One exchange per time step
    Implicit    ///< Sub-iterations until interface convergence
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {

// Small number for comparisons
template<typename T = Real>
inline constexpr T epsilon = std::is_same_v<T, float> ? T(1e-6) : T(1e-12);

} // namespace constants

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* to_string(InterfaceLocation loc) {
    switch (loc) {
        case InterfaceLocation::Face: return "Face";
        case InterfaceLocation::Vertex: return "Vertex";
        default: return "Unknown";
    }
}

inline const char* to_string(CouplingScheme scheme) {
    switch (scheme) {
        case CouplingScheme::Explicit: return "Explicit";
        case CouplingScheme::Implicit: return "Implicit";
        default: return "Unknown";
    }
}

} // namespace fsl
