#ifndef meshslim_Point_hpp_
#define meshslim_Point_hpp_

#include "libmeshslim.h"
#include <cstddef>
#include <vector>
#include <cmath>

#include <Eigen/Geometry>

namespace MeshSlim {

using Vec3u32 = Eigen::Matrix<uint32_t, 3, 1, Eigen::DontAlign>;

using Vec3f   = Eigen::Matrix<float,    3, 1, Eigen::DontAlign>;
using Vec3d   = Eigen::Matrix<double,   3, 1, Eigen::DontAlign>;

using Vec3fs = std::vector<Vec3f>;

// Normalize, keeping a zero vector for a zero length input instead of producing NaNs.
template<class Derived>
inline auto safe_normalized(const Eigen::MatrixBase<Derived> &v) -> typename Derived::PlainObject
{
    typename Derived::PlainObject out = v;
    auto n = out.norm();
    if (n > 0)
        out /= n;
    else
        out.setZero();
    return out;
}

inline bool is_approx(const Vec3f &p1, const Vec3f &p2, float epsilon = float(EPSILON))
{
    return (p1 - p2).cwiseAbs().maxCoeff() < epsilon;
}

} // namespace MeshSlim

#endif // meshslim_Point_hpp_
