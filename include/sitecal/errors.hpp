/**
 * @file errors.hpp
 * @brief Exception taxonomy for the calibration pipeline
 *
 * Every error is fatal for the run that raised it.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sitecal {

/**
 * @brief Base class of all calibration failures
 */
class CalibrationError : public std::runtime_error {
public:
    explicit CalibrationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Bad input data: missing columns, duplicates, too few matched points
 */
class InputError : public CalibrationError {
public:
    explicit InputError(const std::string& message)
        : CalibrationError(message) {}
};

/**
 * @brief Projection could not be resolved or evaluated
 */
class ProjectionError : public CalibrationError {
public:
    explicit ProjectionError(const std::string& message)
        : CalibrationError(message) {}
};

/**
 * @brief Control point geometry is degenerate (near collinear)
 */
class GeometryError : public CalibrationError {
public:
    GeometryError(const std::string& message, double eigenvalue_ratio)
        : CalibrationError(message), eigenvalue_ratio_(eigenvalue_ratio) {}

    /// min/max eigenvalue ratio of the point cloud covariance
    double eigenvalueRatio() const { return eigenvalue_ratio_; }

private:
    double eigenvalue_ratio_;
};

/**
 * @brief Singular or near-singular least-squares system
 */
class NumericError : public CalibrationError {
public:
    explicit NumericError(const std::string& message)
        : CalibrationError(message) {}
};

} // namespace sitecal
