#include "pong/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(float a, float b, float epsilon) {
  return std::fabs(a - b) < epsilon;
}

float clampf(float value, float lo, float hi) {
  if (value > hi) {
    value = hi;
  }
  if (value < lo) {
    value = lo;
  }
  return value;
}

Vector::Vector() : x(0.0f), y(0.0f) {}
Vector::Vector(float x, float y) : x(x), y(y) {}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(float scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

bool Vector::operator==(const Vector& v) const {
  return this->x == v.x && this->y == v.y;
}

bool Vector::operator!=(const Vector& v) const {
  return !(*this == v);
}

float Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

float Vector::length() const {
  return std::sqrt(lengthSquared());
}

float Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}
