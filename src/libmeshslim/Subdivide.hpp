#ifndef meshslim_Subdivide_hpp_
#define meshslim_Subdivide_hpp_

#include "IndexedMesh.hpp"

namespace MeshSlim {

// Split every triangle into three by inserting its centroid, repeated iterations times.
// Each pass triples the triangle count and adds one vertex per former triangle.
// Normals are recalculated. Throws InvalidMeshError for a mesh with out of range indices.
void split_triangles(IndexedMesh &mesh, unsigned int iterations);

} // namespace MeshSlim

#endif // meshslim_Subdivide_hpp_
