#pragma once

/**
 * @file QiGeom.h
 * @brief Main header file for QiGeom library
 *
 * QiGeom is a 2D computational-geometry library whose shapes are generic
 * over the scalar type and an optional coordinate space. Spaces may carry a
 * grid step; every coordinate built in such a space is snapped to it, so
 * geometry derived along different paths stays bit-exact.
 *
 * @author QiGeom Team
 * @version 0.1.0
 */

// Configuration and export macros
#include <QiGeom/QiGeomConfig.h>
#include <QiGeom/Core/Export.h>

// Core types and utilities
#include <QiGeom/Core/Constants.h>
#include <QiGeom/Core/Exception.h>
#include <QiGeom/Core/Validate.h>
#include <QiGeom/Core/Space.h>
#include <QiGeom/Core/Quantized.h>
#include <QiGeom/Core/Angle.h>
#include <QiGeom/Core/QMatrix.h>

// Shapes
#include <QiGeom/Shape/Point.h>
#include <QiGeom/Shape/Line.h>
#include <QiGeom/Shape/Ray.h>
#include <QiGeom/Shape/Circle.h>
#include <QiGeom/Shape/Arc.h>
#include <QiGeom/Shape/Ellipse.h>
#include <QiGeom/Shape/Rectangle.h>
#include <QiGeom/Shape/Triangle.h>
#include <QiGeom/Shape/Polygon.h>

// Algorithms
#include <QiGeom/Intersection/Intersection.h>

namespace Qi::Geom {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return QIGEOM_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = QIGEOM_VERSION_MAJOR;
    minor = QIGEOM_VERSION_MINOR;
    patch = QIGEOM_VERSION_PATCH;
}

} // namespace Qi::Geom
