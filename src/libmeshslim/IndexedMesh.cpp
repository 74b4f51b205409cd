#include "IndexedMesh.hpp"
#include "Exception.hpp"

#include <boost/log/trivial.hpp>
#include <string>

namespace MeshSlim {

void IndexedMesh::recalculate_normals()
{
    normals.assign(positions.size(), Vec3f::Zero());

    for (size_t face_idx = 0; face_idx < this->triangle_count(); ++ face_idx) {
        Vec3f n = unnormalized_face_normal(*this, face_idx);
        for (size_t i = 0; i < 3; ++ i)
            normals[indices[3 * face_idx + i]] += n;
    }

    for (Vec3f &n : normals)
        n = safe_normalized(n);
}

Vec3f IndexedMesh::centroid() const
{
    if (positions.empty())
        return Vec3f::Zero();
    // Accumulate in double, a large mesh would lose precision in float.
    Vec3d sum = Vec3d::Zero();
    for (const Vec3f &p : positions)
        sum += p.cast<double>();
    return (sum / double(positions.size())).cast<float>();
}

BoundingBoxf3 IndexedMesh::bounding_box() const
{
    BoundingBoxf3 bbox;
    bbox.merge(positions);
    return bbox;
}

void validate(const IndexedMesh &mesh)
{
    if (mesh.indices.size() % 3 != 0) {
        std::string msg = "Invalid mesh: index count " + std::to_string(mesh.indices.size()) + " is not a multiple of 3";
        BOOST_LOG_TRIVIAL(error) << msg;
        throw InvalidMeshError(msg);
    }

    for (size_t i = 0; i < mesh.indices.size(); ++ i)
        if (mesh.indices[i] >= mesh.positions.size()) {
            std::string msg = "Invalid mesh: triangle " + std::to_string(i / 3) + " references vertex " +
                std::to_string(mesh.indices[i]) + ", the mesh has " + std::to_string(mesh.positions.size()) + " vertices";
            BOOST_LOG_TRIVIAL(error) << msg;
            throw InvalidMeshError(msg);
        }
}

std::vector<Vec3f> face_normals(const IndexedMesh &mesh)
{
    std::vector<Vec3f> normals;
    normals.reserve(mesh.triangle_count());
    for (size_t face_idx = 0; face_idx < mesh.triangle_count(); ++ face_idx)
        normals.push_back(face_normal(mesh, face_idx));
    return normals;
}

int compactify_vertices(IndexedMesh &mesh, bool shrink_to_fit)
{
    // First used to mark referenced vertices, later used for mapping old vertex index to a new one.
    std::vector<uint32_t> vertex_map(mesh.positions.size(), 0);
    // Mark referenced vertices.
    for (uint32_t idx : mesh.indices)
        vertex_map[idx] = 1;
    // Compactify vertices, update map from old vertex index to a new one.
    bool has_normals = mesh.normals.size() == mesh.positions.size();
    uint32_t last = 0;
    for (uint32_t i = 0; i < uint32_t(vertex_map.size()); ++ i)
        if (vertex_map[i]) {
            if (last < i) {
                mesh.positions[last] = mesh.positions[i];
                if (has_normals)
                    mesh.normals[last] = mesh.normals[i];
            }
            vertex_map[i] = last ++;
        }
    int removed = int(mesh.positions.size()) - int(last);
    if (removed) {
        mesh.positions.erase(mesh.positions.begin() + last, mesh.positions.end());
        if (has_normals)
            mesh.normals.erase(mesh.normals.begin() + last, mesh.normals.end());
        else
            mesh.normals.clear();
        // Update faces with the new vertex indices.
        for (uint32_t &idx : mesh.indices)
            idx = vertex_map[idx];
        // Optionally shrink the vertices.
        if (shrink_to_fit) {
            mesh.positions.shrink_to_fit();
            mesh.normals.shrink_to_fit();
        }
    }
    return removed;
}

void merge(IndexedMesh &A, const IndexedMesh &B)
{
    const auto N = uint32_t(A.positions.size());
    // Normals stay parallel to positions only if both meshes carry them.
    bool keep_normals = A.normals.size() == A.positions.size() && B.normals.size() == B.positions.size();

    A.positions.insert(A.positions.end(), B.positions.begin(), B.positions.end());
    if (keep_normals)
        A.normals.insert(A.normals.end(), B.normals.begin(), B.normals.end());
    else
        A.normals.clear();

    A.indices.reserve(A.indices.size() + B.indices.size());
    for (uint32_t idx : B.indices)
        A.indices.push_back(idx + N);
}

IndexedMesh make_box(const Vec3f &size)
{
    Vec3f h = size / 2.f;
    IndexedMesh box;
    box.positions = {
        {-h.x(), -h.y(), -h.z()}, { h.x(), -h.y(), -h.z()}, {-h.x(),  h.y(), -h.z()}, { h.x(),  h.y(), -h.z()},
        {-h.x(), -h.y(),  h.z()}, { h.x(), -h.y(),  h.z()}, {-h.x(),  h.y(),  h.z()}, { h.x(),  h.y(),  h.z()}
    };
    box.indices = {
        1, 0, 2,  2, 3, 1, // bottom
        5, 1, 7,  3, 7, 1, // right
        4, 5, 6,  7, 6, 5, // top
        0, 4, 2,  6, 2, 4, // left
        3, 2, 7,  6, 7, 2, // back
        1, 4, 0,  4, 1, 5  // front
    };
    box.recalculate_normals();
    return box;
}

Vec3f scene_centroid(const IndexedMeshes &meshes)
{
    Vec3f  center = Vec3f::Zero();
    size_t cnt    = 0;
    for (const IndexedMesh &mesh : meshes)
        if (! mesh.positions.empty()) {
            center += mesh.centroid();
            ++ cnt;
        }
    return cnt == 0 ? center : Vec3f(center / float(cnt));
}

BoundingBoxf3 scene_bounding_box(const IndexedMeshes &meshes)
{
    BoundingBoxf3 bbox;
    for (const IndexedMesh &mesh : meshes)
        bbox.merge(mesh.bounding_box());
    return bbox;
}

} // namespace MeshSlim
