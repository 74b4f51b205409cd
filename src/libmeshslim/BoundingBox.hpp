#ifndef meshslim_BoundingBox_hpp_
#define meshslim_BoundingBox_hpp_

#include "libmeshslim.h"
#include "Exception.hpp"
#include "Point.hpp"
#include <ostream>
#include <iterator>

namespace MeshSlim {

template<class It>
using IteratorOnly = typename std::iterator_traits<It>::iterator_category;

template <class PointType>
class BoundingBox3Base
{
public:
    using PointsType = std::vector<PointType>;
    using Scalar     = typename PointType::Scalar;

    PointType min;
    PointType max;
    bool defined;

    BoundingBox3Base() : min(PointType::Zero()), max(PointType::Zero()), defined(false) {}
    BoundingBox3Base(const PointType &pmin, const PointType &pmax) :
        min(pmin), max(pmax), defined(pmin.x() <= pmax.x() && pmin.y() <= pmax.y() && pmin.z() <= pmax.z()) {}

    template<class It, class = IteratorOnly<It>> BoundingBox3Base(It from, It to) : BoundingBox3Base()
    {
        if (from == to)
            throw MeshSlim::InvalidArgument("Empty point set supplied to BoundingBox3Base constructor");

        for (auto it = from; it != to; ++ it)
            this->merge(it->template cast<Scalar>().eval());
    }

    BoundingBox3Base(const PointsType &points)
        : BoundingBox3Base(points.begin(), points.end())
    {}

    void reset() { this->defined = false; this->min = PointType::Zero(); this->max = PointType::Zero(); }
    void merge(const PointType &point);
    void merge(const PointsType &points);
    void merge(const BoundingBox3Base<PointType> &bb);
    PointType size() const;
    PointType center() const;
    Scalar max_size() const;
    void translate(const PointType &v) { this->min += v; this->max += v; }
    void offset(Scalar delta);
    BoundingBox3Base<PointType> inflated(Scalar delta) const noexcept { BoundingBox3Base<PointType> out(*this); out.offset(delta); return out; }

    bool contains(const PointType &point) const {
        return point.x() >= this->min.x() && point.x() <= this->max.x()
            && point.y() >= this->min.y() && point.y() <= this->max.y()
            && point.z() >= this->min.z() && point.z() <= this->max.z();
    }

    bool contains(const BoundingBox3Base<PointType>& other) const {
        return contains(other.min) && contains(other.max);
    }

    bool operator==(const BoundingBox3Base<PointType> &rhs) const { return this->min == rhs.min && this->max == rhs.max; }
    bool operator!=(const BoundingBox3Base<PointType> &rhs) const { return ! (*this == rhs); }

    friend std::ostream &operator<<(std::ostream &os, const BoundingBox3Base &bbox)
    {
        os << "[" << bbox.max(0) - bbox.min(0) << " x " << bbox.max(1) - bbox.min(1) << " x " << bbox.max(2) - bbox.min(2)
           << "] from (" << bbox.min(0) << ", " << bbox.min(1) << ", " << bbox.min(2) << ")";
        return os;
    }
};

extern template void  BoundingBox3Base<Vec3f>::merge(const Vec3f &point);
extern template void  BoundingBox3Base<Vec3f>::merge(const Vec3fs &points);
extern template void  BoundingBox3Base<Vec3f>::merge(const BoundingBox3Base<Vec3f> &bb);
extern template Vec3f BoundingBox3Base<Vec3f>::size() const;
extern template Vec3f BoundingBox3Base<Vec3f>::center() const;
extern template float  BoundingBox3Base<Vec3f>::max_size() const;
extern template void  BoundingBox3Base<Vec3f>::offset(float delta);

// Bounding box of the single precision mesh vertices.
class BoundingBoxf3 : public BoundingBox3Base<Vec3f>
{
public:
    using BoundingBox3Base::BoundingBox3Base;
    BoundingBoxf3(const BoundingBox3Base<Vec3f> &bb) : BoundingBox3Base<Vec3f>(bb) {}
};

template<typename PointType>
inline bool empty(const BoundingBox3Base<PointType> &bb)
{
    return ! bb.defined || bb.min.x() >= bb.max.x() || bb.min.y() >= bb.max.y() || bb.min.z() >= bb.max.z();
}

} // namespace MeshSlim

#endif // meshslim_BoundingBox_hpp_
