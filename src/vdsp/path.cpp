#include "accelmath/path.hpp"
#include "accelmath/vdsp.hpp"
#include <stdexcept>

namespace accelmath {
namespace vdsp {

Path2D Path2D::from_points(const std::vector<Point2f>& points) {
    Path2D path;
    if (points.empty()) return path;

    path.move_to(points[0]);
    for (std::size_t i = 1; i < points.size(); ++i) {
        path.line_to(points[i]);
    }
    return path;
}

void Path2D::move_to(Point2f p) {
    // A move_to straight after another move_to replaces the pending start point
    if (!m_subpath_starts.empty() && m_subpath_starts.back() == m_points.size() - 1) {
        m_points.back() = p;
        return;
    }
    m_subpath_starts.push_back(m_points.size());
    m_points.push_back(p);
}

void Path2D::line_to(Point2f p) {
    if (m_points.empty()) {
        throw std::runtime_error("Path2D::line_to: no current point, call move_to first");
    }
    m_points.push_back(p);
}

Eigen::VectorXf Path2D::xs() const {
    Eigen::VectorXf v(static_cast<Eigen::Index>(m_points.size()));
    for (std::size_t i = 0; i < m_points.size(); ++i) {
        v[static_cast<Eigen::Index>(i)] = m_points[i].x;
    }
    return v;
}

Eigen::VectorXf Path2D::ys() const {
    Eigen::VectorXf v(static_cast<Eigen::Index>(m_points.size()));
    for (std::size_t i = 0; i < m_points.size(); ++i) {
        v[static_cast<Eigen::Index>(i)] = m_points[i].y;
    }
    return v;
}

Eigen::VectorXf Path2D::distances_from_origin() const {
    return vdist(xs(), ys());
}

Eigen::VectorXf Path2D::segment_lengths() const {
    Eigen::VectorXf x = xs();
    Eigen::VectorXf y = ys();

    // Gather (dx, dy) for every segment of every subpath
    Eigen::VectorXf dx(x.size());
    Eigen::VectorXf dy(y.size());
    Eigen::Index n_seg = 0;

    for (std::size_t s = 0; s < m_subpath_starts.size(); ++s) {
        std::size_t begin = m_subpath_starts[s];
        std::size_t end = (s + 1 < m_subpath_starts.size()) ? m_subpath_starts[s + 1] : m_points.size();
        if (end - begin < 2) continue;

        std::size_t count = end - begin - 1;
        const float* px = x.data() + begin;
        const float* py = y.data() + begin;
        vsub_f32(px + 1, 1, px, 1, dx.data() + n_seg, 1, count);
        vsub_f32(py + 1, 1, py, 1, dy.data() + n_seg, 1, count);
        n_seg += static_cast<Eigen::Index>(count);
    }

    Eigen::VectorXf lengths(n_seg);
    vdist_f32(dx.data(), 1, dy.data(), 1, lengths.data(), 1, static_cast<std::size_t>(n_seg));
    return lengths;
}

float Path2D::length() const {
    return sve(segment_lengths());
}

} // namespace vdsp
} // namespace accelmath
