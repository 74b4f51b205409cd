// ///////////////////////////////////////////
//
// Mesh Simplification Tutorial
//
// (C) by Sven Forstmann in 2014
//
// License : MIT
// http://opensource.org/licenses/MIT
//
// https://github.com/sp4cerat/Fast-Quadric-Mesh-Simplification
//
// 5/2016: Chris Rorden created minimal version for OSX/Linux/Windows compile
// https://github.com/sp4cerat/Fast-Quadric-Mesh-Simplification/
//
// libmeshslim: generic engine working on its own copy of the mesh

#ifndef SIMPLIFYMESHIMPL_HPP
#define SIMPLIFYMESHIMPL_HPP

#include <vector>
#include <array>
#include <type_traits>
#include <algorithm>
#include <functional>
#include <limits>
#include <cmath>
#include <cassert>

#include <boost/log/trivial.hpp>

#include "Exception.hpp"
#include "SimplifyMesh.hpp"

namespace SimplifyMesh {

using Index3 = std::array<size_t, 3>;

template<class Vertex> struct vertex_traits {
    using coord_type = typename Vertex::coord_type;
    using compute_type = coord_type;

    static coord_type x(const Vertex &v);
    static coord_type& x(Vertex &v);

    static coord_type y(const Vertex &v);
    static coord_type& y(Vertex &v);

    static coord_type z(const Vertex &v);
    static coord_type& z(Vertex &v);
};

// The engine reads the input mesh only through these accessors and writes the
// result only through them, it never keeps a pointer into the mesh storage.
template<class Mesh> struct mesh_traits {
    using vertex_t = typename Mesh::vertex_t;

    static size_t   face_count(const Mesh &m);
    static size_t   vertex_count(const Mesh &m);
    static vertex_t vertex(const Mesh &m, size_t vertex_idx);
    static void     vertex(Mesh &m, size_t vertex_idx, const vertex_t &v);
    static Index3   triangle(const Mesh &m, size_t face_idx);
    static void     triangle(Mesh &m, size_t face_idx, const Index3 &t);
    // Resize the output mesh before the vertices and triangles are written.
    static void     update(Mesh &m, size_t vertex_count, size_t face_count);
};

namespace implementation {

// A shorter C++14 style form of the enable_if metafunction
template<bool B, class T>
using enable_if_t = typename std::enable_if<B, T>::type;

// Meta predicates for floating and generic arithmetic types
template<class T, class O = T>
using FloatingOnly = enable_if_t<std::is_floating_point<T>::value, O>;

template<class T, class O = T>
using ArithmeticOnly = enable_if_t<std::is_arithmetic<T>::value, O>;

template< class T >
struct remove_cvref {
    using type = typename std::remove_cv<
        typename std::remove_reference<T>::type>::type;
};

template< class T >
using remove_cvref_t = typename remove_cvref<T>::type;

template<class T> FloatingOnly<T, bool> is_approx(T val, T ref) { return std::abs(val - ref) < 1e-8; }

// Quadric: symmetric 4x4 matrix stored as its 10 independent coefficients
//  m0 m1 m2 m3
//     m4 m5 m6
//        m7 m8
//           m9
template<class T, size_t N = 10> class SymetricMatrix {
public:

    explicit SymetricMatrix(ArithmeticOnly<T> c = T()) { std::fill(m, m + N, c); }

    SymetricMatrix(T m11, T m12, T m13, T m14,
                   T m22, T m23, T m24,
                   T m33, T m34,
                   T m44)
    {
        m[0] = m11;  m[1] = m12;  m[2] = m13;  m[3] = m14;
        m[4] = m22;  m[5] = m23;  m[6] = m24;
        m[7] = m33;  m[8] = m34;
        m[9] = m44;
    }

    // Make plane
    SymetricMatrix(T a, T b, T c, T d)
    {
        m[0] = a * a; m[1] = a * b; m[2] = a * c; m[3] = a * d;
        m[4] = b * b; m[5] = b * c; m[6] = b * d;
        m[7] = c * c; m[8] = c * d;
        m[9] = d * d;
    }

    T operator[](int c) const { return m[c]; }

    // Determinant
    T det(int a11, int a12, int a13,
          int a21, int a22, int a23,
          int a31, int a32, int a33) const
    {
        T det = m[a11] * m[a22] * m[a33] + m[a13] * m[a21] * m[a32] +
                m[a12] * m[a23] * m[a31] - m[a13] * m[a22] * m[a31] -
                m[a11] * m[a23] * m[a32] - m[a12] * m[a21] * m[a33];

        return det;
    }

    const SymetricMatrix operator+(const SymetricMatrix& n) const
    {
        return SymetricMatrix(m[0] + n[0], m[1] + n[1], m[2] + n[2], m[3]+n[3],
                              m[4] + n[4], m[5] + n[5], m[6] + n[6],
                              m[7] + n[7], m[8] + n[8],
                              m[9] + n[9]);
    }

    SymetricMatrix& operator+=(const SymetricMatrix& n)
    {
        m[0]+=n[0]; m[1]+=n[1]; m[2]+=n[2]; m[3]+=n[3];
        m[4]+=n[4]; m[5]+=n[5]; m[6]+=n[6]; m[7]+=n[7];
        m[8]+=n[8]; m[9]+=n[9];

        return *this;
    }

    bool operator==(const SymetricMatrix& n) const { return std::equal(m, m + N, n.m); }
    bool operator!=(const SymetricMatrix& n) const { return ! (*this == n); }

    T m[N];
};

template<class V> using TCoord = typename vertex_traits<remove_cvref_t<V>>::coord_type;
template<class V> using TCompute = typename vertex_traits<remove_cvref_t<V>>::compute_type;
template<class V> inline TCoord<V> x(const V &v) { return vertex_traits<remove_cvref_t<V>>::x(v); }
template<class V> inline TCoord<V> y(const V &v) { return vertex_traits<remove_cvref_t<V>>::y(v); }
template<class V> inline TCoord<V> z(const V &v) { return vertex_traits<remove_cvref_t<V>>::z(v); }
template<class V> inline TCoord<V>& x(V &v) { return vertex_traits<remove_cvref_t<V>>::x(v); }
template<class V> inline TCoord<V>& y(V &v) { return vertex_traits<remove_cvref_t<V>>::y(v); }
template<class V> inline TCoord<V>& z(V &v) { return vertex_traits<remove_cvref_t<V>>::z(v); }
template<class M> using TVertex = typename mesh_traits<remove_cvref_t<M>>::vertex_t;
template<class Mesh> using TMeshCoord = TCoord<TVertex<Mesh>>;

template<class Vertex> TCompute<Vertex> dot(const Vertex &v1, const Vertex &v2)
{
    return TCompute<Vertex>(x(v1)) * x(v2) +
           TCompute<Vertex>(y(v1)) * y(v2) +
           TCompute<Vertex>(z(v1)) * z(v2);
}

template<class Vertex> Vertex cross(const Vertex &a, const Vertex &b)
{
    return Vertex{y(a) * z(b) - z(a) * y(b),
                  z(a) * x(b) - x(a) * z(b),
                  x(a) * y(b) - y(a) * x(b)};
}

template<class Vertex> TCompute<Vertex> lengthsq(const Vertex &v)
{
    return TCompute<Vertex>(x(v)) * x(v) + TCompute<Vertex>(y(v)) * y(v) +
           TCompute<Vertex>(z(v)) * z(v);
}

// A zero length vector stays zero.
template<class Vertex> void normalize(Vertex &v)
{
    double square = std::sqrt(lengthsq(v));
    if (square > 0.) {
        x(v) /= square; y(v) /= square; z(v) /= square;
    } else {
        x(v) = 0; y(v) = 0; z(v) = 0;
    }
}

// Error between vertex and Quadric: [x y z 1] * Q * [x y z 1]^T
template<class T, class Vertex> double vertex_error(const SymetricMatrix<T> &q, const Vertex &v)
{
    T _x = x(v), _y = y(v), _z = z(v);
    return q[0] * _x * _x + 2 * q[1] * _x * _y + 2 * q[2] * _x * _z +
           2 * q[3] * _x + q[4] * _y * _y + 2 * q[5] * _y * _z +
           2 * q[6] * _y + q[7] * _z * _z + 2 * q[8] * _z + q[9];
}

template<class Mesh> class SimplifiableMesh {
public:
    using Vertex     = TVertex<Mesh>;
    using Coord      = TMeshCoord<Mesh>;
    using HiPrecison = TCompute<TVertex<Mesh>>;
    using SymMat     = SymetricMatrix<HiPrecison>;

    // Called with (kept vertex, removed vertex) for every committed collapse.
    using CollapseObserver = std::function<void(size_t, size_t)>;
    using ThrowOnCancel    = std::function<void(void)>;
    using StatusFn         = std::function<void(int)>;

private:
    struct FaceInfo {
        Index3 t;
        double err[4] = {0.};
        bool   deleted = false, dirty = false;
        Vertex n;
        explicit FaceInfo(const Index3 &tri): t(tri), n{0, 0, 0} {}
    };

    struct VertexInfo {
        Vertex p;
        size_t tstart = 0, tcount = 0;
        bool border = false;
        SymMat q;
        explicit VertexInfo(const Vertex &pos): p(pos) {}
    };

    struct Ref { size_t face; size_t vertex; };

    enum class State { Built, Simplified, Extracted };

    std::vector<Ref>        m_refs;
    std::vector<FaceInfo>   m_faceinfo;
    std::vector<VertexInfo> m_vertexinfo;

    // Faces marked for deletion by the flip test, one flag per reference of the tested vertex.
    std::vector<bool>       m_deleted0, m_deleted1;

    // Triangles that may be deleted before the target count is undershot.
    size_t                   m_deletable = 0;

    State                    m_state = State::Built;
    MeshSlim::SimplifyStats  m_stats;
    CollapseObserver         m_collapse_observer;

    void compact_faces();

    // Error for one edge
    double calculate_error(size_t id_v1, size_t id_v2, Vertex &p_result) const;

    void calculate_error(FaceInfo &fi) const
    {
        Vertex p;
        for (size_t j = 0; j < 3; ++j)
            fi.err[j] = calculate_error(fi.t[j], fi.t[(j + 1) % 3], p);

        fi.err[3] = std::min(fi.err[0], std::min(fi.err[1], fi.err[2]));
    }

    void update_mesh(int iteration);

    // Try to collapse the edge (i0, i1) into i0, returns true if committed.
    bool collapse_edge(size_t i0, size_t i1, size_t &deleted_triangles);

    // Update triangle connections and edge error after a edge is collapsed
    void update_triangles(size_t i0, const VertexInfo &vi, const std::vector<bool> &deleted, size_t &deleted_triangles);

    // Check if a triangle flips when this edge is removed
    bool flipped(const Vertex &p, size_t i1, const VertexInfo &v0, std::vector<bool> &deleted) const;

public:

    explicit SimplifiableMesh(const Mesh &m)
    {
        static_assert(
            std::is_arithmetic<Coord>::value,
            "Coordinate type of mesh has to be an arithmetic type!");

        size_t vcount = mesh_traits<Mesh>::vertex_count(m);
        size_t fcount = mesh_traits<Mesh>::face_count(m);

        m_vertexinfo.reserve(vcount);
        m_faceinfo.reserve(fcount);
        for (size_t i = 0; i < vcount; ++i) m_vertexinfo.emplace_back(mesh_traits<Mesh>::vertex(m, i));
        for (size_t i = 0; i < fcount; ++i) m_faceinfo.emplace_back(mesh_traits<Mesh>::triangle(m, i));

        m_stats.triangles_before = fcount;
        m_stats.vertices_before  = vcount;
    }

    // Collapse edges until at most target_count triangles remain or the pass budget is exhausted.
    void simplify_mesh(size_t target_count,
                       const MeshSlim::SimplifyConfig &cfg = {},
                       ThrowOnCancel throw_on_cancel = nullptr,
                       StatusFn statusfn = nullptr);

    // Write the surviving vertices and triangles into the output mesh.
    void extract(Mesh &out);

    void set_collapse_observer(CollapseObserver observer) { m_collapse_observer = std::move(observer); }

    // Valid after the first pass of simplify_mesh().
    bool is_border(size_t vertex_idx) const { return m_vertexinfo[vertex_idx].border; }

    // Number of triangles not deleted yet.
    size_t live_face_count() const
    {
        return size_t(std::count_if(m_faceinfo.begin(), m_faceinfo.end(),
                                    [](const FaceInfo &fi) { return ! fi.deleted; }));
    }

    const MeshSlim::SimplifyStats& stats() const { return m_stats; }
};


template<class Mesh> void SimplifiableMesh<Mesh>::compact_faces()
{
    auto it = std::remove_if(m_faceinfo.begin(), m_faceinfo.end(),
                             [](const FaceInfo &inf) { return inf.deleted; });

    m_faceinfo.erase(it, m_faceinfo.end());
}

template<class Mesh>
double SimplifiableMesh<Mesh>::calculate_error(size_t id_v1, size_t id_v2, Vertex &p_result) const
{
    // compute interpolated vertex

    SymMat q = m_vertexinfo[id_v1].q + m_vertexinfo[id_v2].q;

    bool border = m_vertexinfo[id_v1].border && m_vertexinfo[id_v2].border;
    double     error = 0;
    HiPrecison det   = q.det(0, 1, 2, 1, 4, 5, 2, 5, 7);

    if (!is_approx(det, HiPrecison(0)) && !border)
    {
        // q_delta is invertible
        x(p_result) = Coord(HiPrecison(-1) / det * q.det(1, 2, 3, 4, 5, 6, 5, 7, 8));	// vx = A41/det(q_delta)
        y(p_result) = Coord(HiPrecison( 1) / det * q.det(0, 2, 3, 1, 5, 6, 2, 7, 8));	// vy = A42/det(q_delta)
        z(p_result) = Coord(HiPrecison(-1) / det * q.det(0, 1, 3, 1, 4, 6, 2, 5, 8));	// vz = A43/det(q_delta)

        error = vertex_error(q, p_result);
    } else {
        // det = 0 -> try to find best result
        const Vertex &p1 = m_vertexinfo[id_v1].p;
        const Vertex &p2 = m_vertexinfo[id_v2].p;
        Vertex p3     = (p1 + p2) / 2;
        double error1 = vertex_error(q, p1);
        double error2 = vertex_error(q, p2);
        double error3 = vertex_error(q, p3);
        error         = std::min(error1, std::min(error2, error3));

        // Candidates checked in order, a later candidate of the same error wins.
        if (is_approx(error1, error)) p_result = p1;
        if (is_approx(error2, error)) p_result = p2;
        if (is_approx(error3, error)) p_result = p3;
    }

    return error;
}

template<class Mesh> void SimplifiableMesh<Mesh>::update_mesh(int iteration)
{
    if (iteration > 0) compact_faces();

    // Init Reference ID list
    for (VertexInfo &vi : m_vertexinfo) { vi.tstart = 0; vi.tcount = 0; }

    for (FaceInfo &fi : m_faceinfo)
        for (size_t vidx : fi.t)
            m_vertexinfo[vidx].tcount++;

    size_t tstart = 0;
    for (VertexInfo &vi : m_vertexinfo) {
        vi.tstart = tstart;
        tstart += vi.tcount;
        vi.tcount = 0;
    }

    // Write References
    m_refs.resize(m_faceinfo.size() * 3);
    for (size_t i = 0; i < m_faceinfo.size(); ++i) {
        const FaceInfo &fi = m_faceinfo[i];
        for (size_t j = 0; j < 3; ++j) {
            VertexInfo &vi = m_vertexinfo[fi.t[j]];

            assert(vi.tstart + vi.tcount < m_refs.size());

            Ref &ref = m_refs[vi.tstart + vi.tcount];
            ref.face = i;
            ref.vertex = j;
            vi.tcount++;
        }
    }

    BOOST_LOG_TRIVIAL(trace) << "SimplifiableMesh: references rebuilt in pass " << iteration
                             << ", " << m_faceinfo.size() << " triangles";

    if (iteration != 0)
        return;

    // Identify boundary : a neighbor seen only once around a vertex lies on an open edge.
    for (VertexInfo &vi: m_vertexinfo) vi.border = false;

    std::vector<size_t> vcount, vids;

    for (VertexInfo &vi: m_vertexinfo) {
        vcount.clear();
        vids.clear();

        for(size_t j = 0; j < vi.tcount; ++j) {
            assert(vi.tstart + j < m_refs.size());
            const FaceInfo &fi = m_faceinfo[m_refs[vi.tstart + j].face];

            for (size_t fid : fi.t) {
                size_t ofs = 0;
                while (ofs < vcount.size())
                {
                    if (vids[ofs] == fid) break;
                    ofs++;
                }
                if (ofs == vcount.size())
                {
                    vcount.emplace_back(1);
                    vids.emplace_back(fid);
                }
                else
                    vcount[ofs]++;
            }
        }

        for (size_t j = 0; j < vcount.size(); ++j)
            if(vcount[j] == 1) m_vertexinfo[vids[j]].border = true;
    }

    //
    // Init Quadrics by Plane & Edge Errors
    //
    // required at the beginning ( iteration == 0 )
    // recomputing during the simplification is not required,
    // but mostly improves the result for closed meshes
    //
    for (VertexInfo &vinf : m_vertexinfo) vinf.q = SymMat{};
    for (FaceInfo &finf : m_faceinfo) {
        const Vertex &p0 = m_vertexinfo[finf.t[0]].p;
        Vertex n = cross(Vertex(m_vertexinfo[finf.t[1]].p - p0), Vertex(m_vertexinfo[finf.t[2]].p - p0));
        normalize(n);
        finf.n = n;

        for (size_t vidx : finf.t)
            m_vertexinfo[vidx].q += SymMat(x(n), y(n), z(n), -dot(n, p0));
    }

    // The edge errors need the complete quadrics of both end points.
    for (FaceInfo &finf : m_faceinfo)
        calculate_error(finf);
}

template<class Mesh>
void SimplifiableMesh<Mesh>::update_triangles(size_t                   i0,
                                              const VertexInfo &       vi,
                                              const std::vector<bool> &deleted,
                                              size_t &                 deleted_triangles)
{
    for (size_t k = 0; k < vi.tcount; ++k) {
        assert(vi.tstart + k < m_refs.size());

        // Copy, m_refs grows below.
        Ref r = m_refs[vi.tstart + k];
        FaceInfo &fi = m_faceinfo[r.face];

        if (fi.deleted) continue;

        if (deleted[k]) {
            fi.deleted = true;
            deleted_triangles++;
            continue;
        }

        fi.t[r.vertex] = i0;
        fi.dirty = true;
        calculate_error(fi);
        m_refs.emplace_back(r);
    }
}

template<class Mesh>
bool SimplifiableMesh<Mesh>::flipped(const Vertex &     p,
                                     size_t             i1,
                                     const VertexInfo & v0,
                                     std::vector<bool> &deleted) const
{
    for (size_t k = 0; k < v0.tcount; ++k) {
        size_t ridx = v0.tstart + k;
        assert(ridx < m_refs.size());

        const FaceInfo &fi = m_faceinfo[m_refs[ridx].face];
        if (fi.deleted) continue;

        size_t s   = m_refs[ridx].vertex;
        size_t id1 = fi.t[(s + 1) % 3];
        size_t id2 = fi.t[(s + 2) % 3];

        if(id1 == i1 || id2 == i1) // delete ?
        {
            deleted[k] = true;
            continue;
        }

        Vertex d1 = m_vertexinfo[id1].p - p;
        normalize(d1);
        Vertex d2 = m_vertexinfo[id2].p - p;
        normalize(d2);

        // Sliver: both remaining edges nearly colinear.
        if (std::abs(dot(d1, d2)) > 0.999) return true;

        Vertex n = cross(d1, d2);
        normalize(n);

        deleted[k] = false;
        // Fold over: the face normal would turn by more than ~78 degrees.
        if (dot(n, fi.n) < 0.2) return true;
    }

    return false;
}

template<class Mesh>
bool SimplifiableMesh<Mesh>::collapse_edge(size_t i0, size_t i1, size_t &deleted_triangles)
{
    // Edge of a degenerate input triangle.
    if (i0 == i1) return false;

    VertexInfo &v0 = m_vertexinfo[i0];
    VertexInfo &v1 = m_vertexinfo[i1];

    // Border check
    if (v0.border != v1.border) {
        ++m_stats.rejected_border;
        return false;
    }

    // Compute vertex to collapse to
    Vertex p;
    calculate_error(i0, i1, p);

    m_deleted0.assign(v0.tcount, false);
    m_deleted1.assign(v1.tcount, false);

    // don't remove if flipped
    if (flipped(p, i1, v0, m_deleted0) || flipped(p, i0, v1, m_deleted1)) {
        ++m_stats.rejected_flip;
        return false;
    }

    // The faces sharing the edge are flagged in both lists, count them once.
    if (deleted_triangles + size_t(std::count(m_deleted0.begin(), m_deleted0.end(), true)) > m_deletable)
        return false;

    if (m_collapse_observer) m_collapse_observer(i0, i1);

    // not flipped, so remove edge
    v0.p = p;
    v0.q = v1.q + v0.q;
    size_t tstart = m_refs.size();

    update_triangles(i0, v0, m_deleted0, deleted_triangles);
    update_triangles(i0, v1, m_deleted1, deleted_triangles);

    assert(m_refs.size() >= tstart);

    size_t tcount = m_refs.size() - tstart;

    if (tcount <= v0.tcount) {
        // save ram: the merged list fits into the slice of v0
        if (tcount) {
            auto from = m_refs.begin() + tstart, to = from + tcount;
            std::copy(from, to, m_refs.begin() + v0.tstart);
        }
        m_refs.resize(tstart);
    } else
        // append
        v0.tstart = tstart;

    v0.tcount = tcount;
    v1.tcount = 0;
    ++m_stats.collapses;

    return true;
}

template<class Mesh>
void SimplifiableMesh<Mesh>::simplify_mesh(size_t                          target_count,
                                           const MeshSlim::SimplifyConfig &cfg,
                                           ThrowOnCancel                   throw_on_cancel,
                                           StatusFn                        statusfn)
{
    if (m_state != State::Built)
        throw MeshSlim::LogicError("SimplifiableMesh::simplify_mesh() may be called only once");

    MeshSlim::validate(cfg);

    // init
    for (FaceInfo &fi : m_faceinfo) fi.deleted = false;

    const size_t triangle_count = m_faceinfo.size();
    size_t deleted_triangles = 0;
    m_deletable = triangle_count > target_count ? triangle_count - target_count : 0;
    auto target_reached = [&]() { return triangle_count - deleted_triangles <= target_count; };

    auto report_status = [&]() {
        if (! statusfn) return;
        size_t to_remove = triangle_count > target_count ? triangle_count - target_count : 0;
        int percent = to_remove == 0 ? 100 : int(std::min<size_t>(100, deleted_triangles * 100 / to_remove));
        statusfn(percent);
    };

    // main iteration loop
    for (int iteration = 0; iteration < cfg.max_passes; iteration ++) {
        if (target_reached()) break;

        if (throw_on_cancel) throw_on_cancel();
        report_status();

        // update mesh once in a while, between the updates the references and errors go stale
        if (iteration % cfg.refresh_interval == 0)
            update_mesh(iteration);

        // clear dirty flag
        for (FaceInfo &fi : m_faceinfo) fi.dirty = false;

        //
        // All triangles with edges below the threshold will be removed
        //
        // The following numbers works well for most models.
        // If it does not, try to adjust the 3 parameters
        //
        double threshold = cfg.threshold_scale * std::pow(double(iteration + 3), double(cfg.aggressiveness));

        ++m_stats.passes;
        m_stats.last_threshold = threshold;

        BOOST_LOG_TRIVIAL(debug) << "SimplifiableMesh: pass " << iteration << ", threshold " << threshold
                                 << ", triangles " << triangle_count - deleted_triangles;

        for (size_t fidx = 0; fidx < m_faceinfo.size(); ++fidx) {
            FaceInfo &fi = m_faceinfo[fidx];
            if (fi.err[3] > threshold || fi.deleted || fi.dirty) continue;

            for (size_t j = 0; j < 3; ++j) {
                if (fi.err[j] < threshold &&
                    collapse_edge(fi.t[j], fi.t[(j + 1) % 3], deleted_triangles))
                    // at most one collapse per triangle and pass
                    break;
            }

            if (target_reached()) break;
        }
    }

    m_state = State::Simplified;
    m_stats.triangles_after = triangle_count - deleted_triangles;

    if (statusfn) statusfn(100);
}

template<class Mesh> void SimplifiableMesh<Mesh>::extract(Mesh &out)
{
    if (m_state != State::Simplified)
        throw MeshSlim::LogicError("SimplifiableMesh::extract() requires a single preceding simplify_mesh()");

    compact_faces();

    // tcount marks the referenced vertices, tstart receives the new index
    for (VertexInfo &vi : m_vertexinfo) vi.tcount = 0;

    for (const FaceInfo &fi : m_faceinfo)
        for (size_t vidx : fi.t) m_vertexinfo[vidx].tcount = 1;

    size_t dst = 0;
    for (VertexInfo &vi : m_vertexinfo)
        if (vi.tcount) vi.tstart = dst++;

    size_t vertex_count = dst;
    mesh_traits<Mesh>::update(out, vertex_count, m_faceinfo.size());

    for (const VertexInfo &vi : m_vertexinfo)
        if (vi.tcount) mesh_traits<Mesh>::vertex(out, vi.tstart, vi.p);

    dst = 0;
    for (const FaceInfo &fi : m_faceinfo) {
        Index3 t = fi.t;
        for (size_t &idx : t) idx = m_vertexinfo[idx].tstart;
        mesh_traits<Mesh>::triangle(out, dst++, t);
    }

    m_stats.triangles_after = m_faceinfo.size();
    m_stats.vertices_after  = vertex_count;
    m_state = State::Extracted;
}

} // namespace implementation
} // namespace SimplifyMesh

#endif // SIMPLIFYMESHIMPL_HPP
