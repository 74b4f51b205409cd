#ifndef meshslim_test_meshes_hpp_
#define meshslim_test_meshes_hpp_

#include <vector>

#include "libmeshslim/IndexedMesh.hpp"
#include "libmeshslim/SimplifyMeshImpl.hpp"

namespace MeshSlim { namespace test {

// Minimal mesh type unrelated to IndexedMesh, simplified through its own traits.
struct Point3d { double x, y, z; };

inline Point3d operator+(const Point3d &a, const Point3d &b) { return { a.x + b.x, a.y + b.y, a.z + b.z }; }
inline Point3d operator-(const Point3d &a, const Point3d &b) { return { a.x - b.x, a.y - b.y, a.z - b.z }; }
inline Point3d operator/(const Point3d &a, double s) { return { a.x / s, a.y / s, a.z / s }; }

struct SoupMesh {
    std::vector<Point3d>               points;
    std::vector<SimplifyMesh::Index3>  faces;
};

// Flat grid of n x n squares in the z = 0 plane, two triangles per square, facing +z.
inline IndexedMesh make_grid(unsigned n, float spacing = 1.f)
{
    IndexedMesh mesh;
    for (unsigned j = 0; j <= n; ++ j)
        for (unsigned i = 0; i <= n; ++ i)
            mesh.positions.emplace_back(spacing * float(i), spacing * float(j), 0.f);

    auto idx = [n](unsigned i, unsigned j) { return uint32_t(j * (n + 1) + i); };
    for (unsigned j = 0; j < n; ++ j)
        for (unsigned i = 0; i < n; ++ i) {
            mesh.indices.insert(mesh.indices.end(), { idx(i, j), idx(i + 1, j), idx(i + 1, j + 1) });
            mesh.indices.insert(mesh.indices.end(), { idx(i, j), idx(i + 1, j + 1), idx(i, j + 1) });
        }

    mesh.recalculate_normals();
    return mesh;
}

inline SoupMesh to_soup(const IndexedMesh &mesh)
{
    SoupMesh out;
    for (const Vec3f &p : mesh.positions)
        out.points.push_back({ double(p.x()), double(p.y()), double(p.z()) });
    for (size_t i = 0; i < mesh.triangle_count(); ++ i) {
        Vec3u32 t = mesh.triangle(i);
        out.faces.push_back({ size_t(t(0)), size_t(t(1)), size_t(t(2)) });
    }
    return out;
}

}} // namespace MeshSlim::test

namespace SimplifyMesh {

template<> struct vertex_traits<MeshSlim::test::Point3d> {
    using coord_type   = double;
    using compute_type = double;

    static inline double  x(const MeshSlim::test::Point3d &v) { return v.x; }
    static inline double& x(MeshSlim::test::Point3d &v) { return v.x; }

    static inline double  y(const MeshSlim::test::Point3d &v) { return v.y; }
    static inline double& y(MeshSlim::test::Point3d &v) { return v.y; }

    static inline double  z(const MeshSlim::test::Point3d &v) { return v.z; }
    static inline double& z(MeshSlim::test::Point3d &v) { return v.z; }
};

template<> struct mesh_traits<MeshSlim::test::SoupMesh> {
    using vertex_t = MeshSlim::test::Point3d;

    static size_t face_count(const MeshSlim::test::SoupMesh &m) { return m.faces.size(); }
    static size_t vertex_count(const MeshSlim::test::SoupMesh &m) { return m.points.size(); }
    static vertex_t vertex(const MeshSlim::test::SoupMesh &m, size_t idx) { return m.points[idx]; }
    static void vertex(MeshSlim::test::SoupMesh &m, size_t idx, const vertex_t &v) { m.points[idx] = v; }
    static Index3 triangle(const MeshSlim::test::SoupMesh &m, size_t idx) { return m.faces[idx]; }
    static void triangle(MeshSlim::test::SoupMesh &m, size_t idx, const Index3 &t) { m.faces[idx] = t; }
    static void update(MeshSlim::test::SoupMesh &m, size_t vc, size_t fc)
    {
        m.points.resize(vc);
        m.faces.resize(fc);
    }
};

} // namespace SimplifyMesh

#endif // meshslim_test_meshes_hpp_
