// =====================================================================
//  src/libmassing/render/primitives.cpp — Declarative draw commands
// =====================================================================
//
//  Part of libmassing.
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <massing/render/primitives.h>

namespace massing {
namespace render {

using geometry::Point3;

QVector<Point3> rectangleOutline(double width, double depth)
{
    const double hw = width / 2.0;
    const double hd = depth / 2.0;

    const Point3 a(-hw, 0.0, -hd);
    const Point3 b( hw, 0.0, -hd);
    const Point3 c( hw, 0.0,  hd);
    const Point3 d(-hw, 0.0,  hd);

    return { a, b, b, c, c, d, d, a };
}

const Primitive* findPrimitive(const QVector<Primitive>& primitives, const QString& role)
{
    for (const Primitive& p : primitives) {
        if (p.role == role) {
            return &p;
        }
    }
    return nullptr;
}

}  // namespace render
}  // namespace massing
