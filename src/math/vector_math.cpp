#include "elastic/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a - b) < epsilon;
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position Position::operator+(const Vector& d) const {
  return {this->x + d.x, this->y + d.y};
}

Position Position::operator-(const Vector& d) const {
  return {this->x - d.x, this->y - d.y};
}

Vector Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

// Positions move by displacements, not by other positions
Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  return *this;
}

Position& Position::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector Vector::operator-() const {
  return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
  return std::sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::normalized(double minLength) const {
  double const len = this->length();
  if (len > minLength) {
    return {this->x / len, this->y / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0};
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

Vector operator*(double scalar, const Vector& v) {
  return v * scalar;
}
