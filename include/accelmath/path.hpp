#pragma once

#include <cstddef>
#include <vector>
#include <Eigen/Dense>

namespace accelmath {
namespace vdsp {

struct Point2f {
    float x;
    float y;
};

/**
 * @brief A 2-D polyline made of one or more subpaths.
 *
 * move_to() starts a new subpath at a point, line_to() extends the current
 * subpath with a straight segment. Measurements are computed with the vdsp
 * kernels on the structure-of-arrays coordinates (xs, ys).
 */
class Path2D {
public:
    Path2D() = default;

    /**
     * @brief Builds a single open subpath through the given points, in order.
     */
    static Path2D from_points(const std::vector<Point2f>& points);

    void move_to(Point2f p);

    /**
     * @brief Appends a segment from the current point to p.
     * @throws std::runtime_error if the path has no current point.
     */
    void line_to(Point2f p);

    const std::vector<Point2f>& points() const { return m_points; }
    std::size_t size() const { return m_points.size(); }
    bool empty() const { return m_points.empty(); }
    std::size_t subpath_count() const { return m_subpath_starts.size(); }

    Eigen::VectorXf xs() const;
    Eigen::VectorXf ys() const;

    // Distance of every point from the origin
    Eigen::VectorXf distances_from_origin() const;

    // Length of each drawn segment, in drawing order. Jumps between
    // subpaths are not segments.
    Eigen::VectorXf segment_lengths() const;

    // Sum of segment_lengths()
    float length() const;

private:
    std::vector<Point2f> m_points;
    std::vector<std::size_t> m_subpath_starts;
};

} // namespace vdsp
} // namespace accelmath
