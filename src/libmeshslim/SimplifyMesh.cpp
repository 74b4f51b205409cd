#include "SimplifyMesh.hpp"
#include "SimplifyMeshImpl.hpp"
#include "Exception.hpp"
#include "Utils.hpp"

#include <boost/log/trivial.hpp>

#include <string>

namespace SimplifyMesh {

template<> struct vertex_traits<MeshSlim::Vec3f> {
    using coord_type = float;
    using compute_type = double;

    static inline float x(const MeshSlim::Vec3f &v) { return v.x(); }
    static inline float& x(MeshSlim::Vec3f &v) { return v.x(); }

    static inline float y(const MeshSlim::Vec3f &v) { return v.y(); }
    static inline float& y(MeshSlim::Vec3f &v) { return v.y(); }

    static inline float z(const MeshSlim::Vec3f &v) { return v.z(); }
    static inline float& z(MeshSlim::Vec3f &v) { return v.z(); }
};

template<> struct mesh_traits<MeshSlim::IndexedMesh> {
    using vertex_t = MeshSlim::Vec3f;
    static size_t face_count(const MeshSlim::IndexedMesh &m)
    {
        return m.triangle_count();
    }
    static size_t vertex_count(const MeshSlim::IndexedMesh &m)
    {
        return m.positions.size();
    }
    static vertex_t vertex(const MeshSlim::IndexedMesh &m, size_t idx)
    {
        return m.positions[idx];
    }
    static void vertex(MeshSlim::IndexedMesh &m, size_t idx, const vertex_t &v)
    {
        m.positions[idx] = v;
    }
    static Index3 triangle(const MeshSlim::IndexedMesh &m, size_t idx)
    {
        std::array<size_t, 3> t;
        for (size_t i = 0; i < 3; ++i) t[i] = size_t(m.indices[3 * idx + i]);
        return t;
    }
    static void triangle(MeshSlim::IndexedMesh &m, size_t fidx, const Index3 &t)
    {
        for (size_t i = 0; i < 3; ++i) m.indices[3 * fidx + i] = uint32_t(t[i]);
    }
    static void update(MeshSlim::IndexedMesh &m, size_t vc, size_t fc)
    {
        m.positions.resize(vc);
        m.indices.resize(3 * fc);
    }
};

} // namespace SimplifyMesh

namespace MeshSlim {

void validate(const SimplifyConfig &cfg)
{
    if (! (cfg.aggressiveness > 0.f) || ! std::isfinite(cfg.aggressiveness))
        throw InvalidArgument("Simplify: aggressiveness has to be a positive number, got " + std::to_string(cfg.aggressiveness));
    if (cfg.max_passes <= 0)
        throw InvalidArgument("Simplify: max_passes has to be positive, got " + std::to_string(cfg.max_passes));
    if (cfg.refresh_interval <= 0)
        throw InvalidArgument("Simplify: refresh_interval has to be positive, got " + std::to_string(cfg.refresh_interval));
    if (! (cfg.threshold_scale > 0.) || ! std::isfinite(cfg.threshold_scale))
        throw InvalidArgument("Simplify: threshold_scale has to be a positive number");
}

void simplify_mesh(IndexedMesh &              mesh,
                   uint32_t                   target_triangle_count,
                   const SimplifyConfig &     cfg,
                   SimplifyStats *            stats,
                   std::function<void(void)>  throw_on_cancel,
                   std::function<void(int)>   statusfn)
{
    init_default_logging_level();
    validate(mesh);
    validate(cfg);

    // check input
    if (target_triangle_count >= mesh.triangle_count()) {
        BOOST_LOG_TRIVIAL(debug) << "simplify_mesh: " << mesh.triangle_count()
                                 << " triangles already within the target of " << target_triangle_count;
        mesh.recalculate_normals();
        if (stats) {
            *stats = SimplifyStats();
            stats->triangles_before = stats->triangles_after = mesh.triangle_count();
            stats->vertices_before  = stats->vertices_after  = mesh.vertex_count();
        }
        if (statusfn) statusfn(100);
        return;
    }

    SimplifyMesh::implementation::SimplifiableMesh<IndexedMesh> sm{mesh};
    sm.simplify_mesh(target_triangle_count, cfg, std::move(throw_on_cancel), std::move(statusfn));

    IndexedMesh out;
    sm.extract(out);
    out.recalculate_normals();
    mesh = std::move(out);

    const SimplifyStats &st = sm.stats();
    BOOST_LOG_TRIVIAL(info) << "simplify_mesh: triangles " << st.triangles_before << " -> " << st.triangles_after
                            << ", vertices " << st.vertices_before << " -> " << st.vertices_after
                            << " in " << st.passes << " passes (" << st.collapses << " collapses, target "
                            << target_triangle_count << ")";
    if (stats)
        *stats = st;
}

IndexedMesh simplified(const IndexedMesh &mesh, uint32_t target_triangle_count, float aggressiveness)
{
    SimplifyConfig cfg;
    cfg.aggressiveness = aggressiveness;
    IndexedMesh out = mesh; // copy
    simplify_mesh(out, target_triangle_count, cfg);
    return out;
}

uint32_t target_triangle_count(const IndexedMesh &mesh, float ratio)
{
    if (! (ratio >= 0.f && ratio <= 1.f))
        throw InvalidArgument("Simplify: ratio has to be in <0, 1>, got " + std::to_string(ratio));
    return uint32_t(double(ratio) * double(mesh.triangle_count()));
}

} // namespace MeshSlim
