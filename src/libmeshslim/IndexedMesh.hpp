#ifndef meshslim_IndexedMesh_hpp_
#define meshslim_IndexedMesh_hpp_

#include "libmeshslim.h"
#include "Point.hpp"
#include "BoundingBox.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace MeshSlim {

// Indexed triangle mesh shared by the decimation and the subdivision.
// Each triangle is formed by three consecutive entries of indices.
// Normals are per vertex and parallel to positions once recalculate_normals() was called.
struct IndexedMesh
{
    IndexedMesh() {}

    void clear() { positions.clear(); normals.clear(); indices.clear(); }

    std::vector<Vec3f>    positions;
    std::vector<Vec3f>    normals;
    std::vector<uint32_t> indices;

    bool   empty() const { return positions.empty() || normals.empty() || indices.empty(); }
    size_t vertex_count() const { return positions.size(); }
    size_t triangle_count() const { return indices.size() / 3; }

    Vec3u32 triangle(size_t idx) const { return { indices[3 * idx], indices[3 * idx + 1], indices[3 * idx + 2] }; }
    std::array<Vec3f, 3> triangle_vertices(size_t idx) const {
        return { positions[indices[3 * idx]], positions[indices[3 * idx + 1]], positions[indices[3 * idx + 2]] };
    }

    // Sum the unnormalized face normals onto the face vertices, then normalize.
    // A vertex without any face of non-zero area receives a zero normal.
    void          recalculate_normals();
    // Arithmetic mean of the positions, zero for a mesh without vertices.
    Vec3f         centroid() const;
    // Not defined for a mesh without vertices.
    BoundingBoxf3 bounding_box() const;
};

using IndexedMeshes = std::vector<IndexedMesh>;

// Throws InvalidMeshError if the index buffer does not describe whole triangles
// or if any index points past the vertex array.
void validate(const IndexedMesh &mesh);

inline Vec3f unnormalized_face_normal(const IndexedMesh &mesh, size_t face_idx)
{
    std::array<Vec3f, 3> p = mesh.triangle_vertices(face_idx);
    return (p[1] - p[0]).cross(p[2] - p[0]);
}

// Unit normal of a face, zero vector for a degenerate face.
inline Vec3f face_normal(const IndexedMesh &mesh, size_t face_idx)
{
    return safe_normalized(unnormalized_face_normal(mesh, face_idx));
}

std::vector<Vec3f> face_normals(const IndexedMesh &mesh);

// Remove vertices not referenced by any triangle, remap the indices.
// Returns the number of removed vertices.
int compactify_vertices(IndexedMesh &mesh, bool shrink_to_fit = true);

// Append B to A, B's indices are shifted behind A's vertices.
void merge(IndexedMesh &A, const IndexedMesh &B);

// Box centered at the origin with outward facing triangles, normals calculated.
IndexedMesh make_box(const Vec3f &size);
inline IndexedMesh make_unit_box() { return make_box(Vec3f(1.f, 1.f, 1.f)); }

// Mean of the centroids of the non-empty meshes.
Vec3f         scene_centroid(const IndexedMeshes &meshes);
// Union of the bounding boxes of the meshes.
BoundingBoxf3 scene_bounding_box(const IndexedMeshes &meshes);

} // namespace MeshSlim

#endif // meshslim_IndexedMesh_hpp_
