#include "Subdivide.hpp"
#include "Utils.hpp"

#include <boost/log/trivial.hpp>

namespace MeshSlim {

void split_triangles(IndexedMesh &mesh, unsigned int iterations)
{
    init_default_logging_level();
    validate(mesh);

    const size_t triangles_before = mesh.triangle_count();
    std::vector<uint32_t> new_indices;

    for (unsigned int iter = 0; iter < iterations; ++ iter) {
        // Every pass starts with an empty output, it consumes the complete output of the previous pass.
        new_indices.clear();
        new_indices.reserve(mesh.indices.size() * 3);
        // Reserved, so that v0..v2 below stay valid while the centroids are appended.
        mesh.positions.reserve(mesh.positions.size() + mesh.triangle_count());

        for (size_t face_idx = 0; face_idx < mesh.triangle_count(); ++ face_idx) {
            Vec3u32 t = mesh.triangle(face_idx);
            const Vec3f &v0 = mesh.positions[t(0)];
            const Vec3f &v1 = mesh.positions[t(1)];
            const Vec3f &v2 = mesh.positions[t(2)];

            Vec3f centroid = (v0 + v1 + v2) / 3.f;
            auto  new_idx  = uint32_t(mesh.positions.size());
            mesh.positions.push_back(centroid);

            new_indices.insert(new_indices.end(), { t(0), t(1), new_idx });
            new_indices.insert(new_indices.end(), { t(1), t(2), new_idx });
            new_indices.insert(new_indices.end(), { t(2), t(0), new_idx });
        }

        mesh.indices.swap(new_indices);

        BOOST_LOG_TRIVIAL(debug) << "split_triangles: pass " << iter << ", " << mesh.triangle_count() << " triangles";
    }

    mesh.recalculate_normals();

    BOOST_LOG_TRIVIAL(info) << "split_triangles: triangles " << triangles_before << " -> " << mesh.triangle_count()
                            << " in " << iterations << " passes";
}

} // namespace MeshSlim
