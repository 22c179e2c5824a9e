/**
 * @file vector_math.hpp
 * @brief 2D vector mathematics in arena units
 *
 * Arena coordinates are single precision: x grows to the right, y grows toward
 * the top of the play field.
 */

#ifndef PONG_VECTOR_MATH_HPP
#define PONG_VECTOR_MATH_HPP

/**
 * @brief Threshold for floating point equality tests
 */
constexpr float EPSILON = 1e-5f;

/**
 * @brief Compares two floats for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(float a, float b, float epsilon = EPSILON);

/**
 * @brief Clamps a value into [lo, hi]
 *
 * Unlike std::clamp this tolerates lo > hi (degenerate ranges collapse to lo).
 */
float clampf(float value, float lo, float hi);

/**
 * @brief A 2D vector used for velocities and offsets
 */
class Vector {
public:
    float x;  ///< X component
    float y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(float x, float y);

    Vector operator-() const;
    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector operator*(float scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);

    bool operator==(const Vector& v) const;
    bool operator!=(const Vector& v) const;

    /** @brief Squared magnitude */
    float lengthSquared() const;

    /** @brief Returns vector magnitude */
    float length() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    float dotProduct(const Vector& v) const;
};

#endif // PONG_VECTOR_MATH_HPP
