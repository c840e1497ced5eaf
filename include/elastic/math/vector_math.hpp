/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * Provides the two value types every other module works with:
 * - Position for absolute locations in the plane
 * - Vector for velocities, displacements and contact normals
 */

#ifndef ELASTIC_VECTOR_MATH_HPP
#define ELASTIC_VECTOR_MATH_HPP

class Vector;
class Position;

/**
 * @brief Threshold for floating point equality tests
 */
constexpr double EPSILON = 1e-9;

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = EPSILON);

/**
 * @brief Represents a 2D point in space
 *
 * Supports basic arithmetic and conversion to/from Vector.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /** @brief Offsets the position by a displacement */
    Position operator+(const Vector& d) const;

    /** @brief Offsets the position backwards by a displacement */
    Position operator-(const Vector& d) const;

    /** @brief Displacement from @p b to this position */
    Vector operator-(const Position& b) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoiding the square root */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * Falls back to (1,0) when the vector is shorter than @p minLength.
     */
    Vector normalized(double minLength = EPSILON) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

/** @brief Scalar-first multiplication, s * v */
Vector operator*(double scalar, const Vector& v);

#endif
