/*
 * Physical LED layouts described as shapes and resolved to one coordinate
 * per LED, in wiring order.
 */

#pragma once

#include <stdint.h>
#include <stddef.h>
#include <math.h>

#include "config.h"
#include "errors.h"
#include "vec.h"

namespace shimmer {

enum class ShapeKind : uint8_t {
    point,
    line,
    grid,
    arc,
    pointList,
};

// A geometric primitive that expands into a run of LED coordinates.
// Use the static factories rather than filling in fields directly.
template <size_t N>
struct Shape {
    ShapeKind kind = ShapeKind::point;

    // Point position, line and grid start, arc center.
    Vec<N> start{};
    // Line end, or the far end of a grid's first row.
    Vec<N> rowEnd{};
    // Far end of a grid's first column.
    Vec<N> colEnd{};

    size_t rows = 0, cols = 0;
    bool serpentine = false;

    // Arc radius and angle range in radians, measured from the +x axis
    // toward +y.
    float radius = 0, angleStart = 0, angleEnd = 0;

    // Pixels in a point, line, arc or point list.
    size_t count = 0;

    // Point list coordinates, owned by the caller.
    const Vec<N>* points = nullptr;

    static constexpr Shape point(Vec<N> position, size_t count = 1) {
        Shape s;
        s.kind = ShapeKind::point;
        s.start = position;
        s.count = count;
        return s;
    }

    static constexpr Shape line(Vec<N> start, Vec<N> end, size_t count) {
        Shape s;
        s.kind = ShapeKind::line;
        s.start = start;
        s.rowEnd = end;
        s.count = count;
        return s;
    }

    static constexpr Shape grid(Vec<N> start, Vec<N> rowEnd, Vec<N> colEnd,
            size_t rows, size_t cols, bool serpentine) {
        Shape s;
        s.kind = ShapeKind::grid;
        s.start = start;
        s.rowEnd = rowEnd;
        s.colEnd = colEnd;
        s.rows = rows;
        s.cols = cols;
        s.serpentine = serpentine;
        return s;
    }

    static constexpr Shape arc(Vec<N> center, float radius,
            float angleStart, float angleEnd, size_t count) {
        Shape s;
        s.kind = ShapeKind::arc;
        s.start = center;
        s.radius = radius;
        s.angleStart = angleStart;
        s.angleEnd = angleEnd;
        s.count = count;
        return s;
    }

    static constexpr Shape pointList(const Vec<N>* points, size_t count) {
        Shape s;
        s.kind = ShapeKind::pointList;
        s.points = points;
        s.count = count;
        return s;
    }

    constexpr size_t pixelCount() const {
        return kind == ShapeKind::grid ? rows * cols :
                kind == ShapeKind::pointList && points == nullptr ? 0 : count;
    }

    // Coordinate of the |index|th LED of this shape, in wiring order.
    Vec<N> pointAt(size_t index) const;
};

// Sum of the pixel counts of a run of shapes.
template <size_t N>
constexpr size_t totalPixelCount(const Shape<N>* shapes, size_t shapeCount) {
    size_t total = 0;
    for (size_t i = 0; i < shapeCount; ++i) total += shapes[i].pixelCount();
    return total;
}

template <size_t N, size_t K>
constexpr size_t totalPixelCount(const Shape<N> (&shapes)[K]) {
    return totalPixelCount(shapes, K);
}

template <size_t N>
Vec<N> Shape<N>::pointAt(size_t index) const {
    switch (kind) {
        case ShapeKind::point:
            return start;

        case ShapeKind::line:
            if (count <= 1) return start;
            return lerp(start, rowEnd, float(index) / float(count - 1));

        case ShapeKind::grid: {
            size_t row = index / cols;
            size_t col = index % cols;
            if (serpentine && (row & 1)) col = cols - 1 - col;
            float colFraction = cols > 1 ? float(col) / float(cols - 1) : 0.0f;
            float rowFraction = rows > 1 ? float(row) / float(rows - 1) : 0.0f;
            return start + (rowEnd - start) * colFraction + (colEnd - start) * rowFraction;
        }

        case ShapeKind::arc: {
            // A full turn would land the last LED on top of the first, so the
            // end angle is only included for partial arcs.
            float range = angleEnd - angleStart;
            bool fullTurn = fabsf(range) >= twoPi - 1e-4f;
            size_t steps = fullTurn ? count : count - 1;
            float angle = steps > 0 ? angleStart + range * float(index) / float(steps) : angleStart;
            Vec<N> out = start;
            out.v[0] += radius * cosf(angle);
            if constexpr (N >= 2) out.v[1] += radius * sinf(angle);
            return out;
        }

        case ShapeKind::pointList:
            return points[index];
    }
    return start;
}

// The resolved coordinates of every LED, in wiring order.
// Storage is fixed at |Capacity| coordinates, the active count is set once
// when the layout is assigned.
template <size_t N, size_t Capacity>
class Layout {
    static_assert(Capacity > 0, "layouts hold at least one pixel");

    Vec<N> points_[Capacity];
    size_t size_ = 0;

public:
    static constexpr size_t dimensions = N;
    static constexpr size_t capacity = Capacity;

    using Shape = shimmer::Shape<N>;

    // Checks that |shapes| can be resolved into this layout and that they
    // add up to exactly |expectedPixels|.
    [[nodiscard]] static Error validate(const Shape* shapes, size_t shapeCount, size_t expectedPixels) {
        if (shapes == nullptr || shapeCount == 0) return Error::missingLayout;
        if (shapeCount > config::maxShapes) return Error::tooManyShapes;
        for (size_t i = 0; i < shapeCount; ++i) {
            if (shapes[i].pixelCount() == 0) return Error::emptyShape;
        }
        size_t total = totalPixelCount(shapes, shapeCount);
        if (total > Capacity) return Error::capacityExceeded;
        if (total != expectedPixels) return Error::pixelCountMismatch;
        return Error::none;
    }

    // Resolves shapes that have already passed validate().
    void assign(const Shape* shapes, size_t shapeCount) {
        size_ = 0;
        for (size_t i = 0; i < shapeCount; ++i) {
            const Shape& shape = shapes[i];
            size_t count = shape.pixelCount();
            for (size_t j = 0; j < count && size_ < Capacity; ++j) {
                points_[size_++] = shape.pointAt(j);
            }
        }
    }

    size_t size() const { return size_; }
    const Vec<N>& operator[](size_t i) const { return points_[i]; }
    const Vec<N>* begin() const { return points_; }
    const Vec<N>* end() const { return points_ + size_; }
};

} // namespace shimmer
