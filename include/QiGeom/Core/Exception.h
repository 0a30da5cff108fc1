#pragma once

#include <QiGeom/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for QiGeom
 *
 * Geometry queries never throw; degenerate answers come back as
 * std::optional or empty containers. Exceptions are reserved for broken
 * caller contracts (bad index, impossible factory parameters).
 */

#include <stdexcept>
#include <string>

namespace Qi::Geom {

/**
 * @brief Base exception class for QiGeom
 */
class QIGEOM_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class QIGEOM_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception (e.g., vertex index past the end)
 */
class QIGEOM_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

} // namespace Qi::Geom
