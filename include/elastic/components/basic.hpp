#ifndef ELASTIC_COMPONENTS_BASIC_HPP
#define ELASTIC_COMPONENTS_BASIC_HPP

#include <cstddef>
#include <cstdint>
#include "elastic/math/vector_math.hpp" // for Position, Vector

namespace Components {

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Radius {
        double value;
    };

    // Stored alongside Radius so bodies restored from the registry keep
    // exactly the mass they were created with
    struct Mass {
        double value;
    };

    // Stable input order of a body; the integrator sweeps pairs in this order
    struct BodyIndex {
        std::size_t value;
    };

    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif
