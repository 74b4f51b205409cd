#include "BoundingBox.hpp"

namespace MeshSlim {

template <class PointType> void
BoundingBox3Base<PointType>::merge(const PointType &point)
{
    if (this->defined) {
        this->min = this->min.cwiseMin(point);
        this->max = this->max.cwiseMax(point);
    } else {
        this->min = point;
        this->max = point;
        this->defined = true;
    }
}
template void BoundingBox3Base<Vec3f>::merge(const Vec3f &point);

template <class PointType> void
BoundingBox3Base<PointType>::merge(const PointsType &points)
{
    for (const PointType &pt : points)
        this->merge(pt);
}
template void BoundingBox3Base<Vec3f>::merge(const Vec3fs &points);

template <class PointType> void
BoundingBox3Base<PointType>::merge(const BoundingBox3Base<PointType> &bb)
{
    if (bb.defined) {
        if (this->defined) {
            this->min = this->min.cwiseMin(bb.min);
            this->max = this->max.cwiseMax(bb.max);
        } else {
            this->min = bb.min;
            this->max = bb.max;
            this->defined = true;
        }
    }
}
template void BoundingBox3Base<Vec3f>::merge(const BoundingBox3Base<Vec3f> &bb);

template <class PointType> PointType
BoundingBox3Base<PointType>::size() const
{
    return this->max - this->min;
}
template Vec3f BoundingBox3Base<Vec3f>::size() const;

template <class PointType> PointType
BoundingBox3Base<PointType>::center() const
{
    return (this->min + this->max) / 2;
}
template Vec3f BoundingBox3Base<Vec3f>::center() const;

template <class PointType> typename BoundingBox3Base<PointType>::Scalar
BoundingBox3Base<PointType>::max_size() const
{
    PointType s = size();
    return std::max(s(0), std::max(s(1), s(2)));
}
template float  BoundingBox3Base<Vec3f>::max_size() const;

template <class PointType> void
BoundingBox3Base<PointType>::offset(Scalar delta)
{
    PointType v(delta, delta, delta);
    this->min -= v;
    this->max += v;
}
template void BoundingBox3Base<Vec3f>::offset(float delta);

} // namespace MeshSlim
