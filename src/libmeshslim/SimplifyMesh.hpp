#ifndef MESHSIMPLIFY_HPP
#define MESHSIMPLIFY_HPP

#include <cstdint>
#include <functional>

#include <libmeshslim/IndexedMesh.hpp>

namespace MeshSlim {

// Tuning knobs of the quadric edge collapse.
struct SimplifyConfig {
    // Exponent of the error threshold growth, 1e-9 * (pass + 3) ^ aggressiveness.
    // Higher values accept costlier collapses in earlier passes.
    float  aggressiveness   = 7.f;
    // Safety cap on the number of passes.
    int    max_passes       = 100;
    // Adjacency is rebuilt every refresh_interval passes, stale in between.
    int    refresh_interval = 5;
    double threshold_scale  = 1e-9;
};

struct SimplifyStats {
    size_t triangles_before = 0;
    size_t triangles_after  = 0;
    size_t vertices_before  = 0;
    size_t vertices_after   = 0;
    // Passes started before the target was reached or the budget exhausted.
    int    passes           = 0;
    size_t collapses        = 0;
    size_t rejected_border  = 0;
    size_t rejected_flip    = 0;
    double last_threshold   = 0.;
};

// Throws InvalidArgument for non-positive or non-finite values.
void validate(const SimplifyConfig &cfg);

/// Simplify the mesh by quadric edge collapse, in place.
/// The triangle count is reduced towards target_triangle_count, never below it.
/// The pass budget may run out before the target is reached. Normals are recalculated.
/// throw_on_cancel is called at the beginning of every pass, whatever it throws
/// propagates and the mesh stays untouched. statusfn receives 0 - 100.
/// Throws InvalidMeshError for a mesh with out of range indices.
void simplify_mesh(IndexedMesh &              mesh,
                   uint32_t                   target_triangle_count,
                   const SimplifyConfig &     cfg             = {},
                   SimplifyStats *            stats           = nullptr,
                   std::function<void(void)>  throw_on_cancel = nullptr,
                   std::function<void(int)>   statusfn        = nullptr);

// Reduced copy of the mesh.
IndexedMesh simplified(const IndexedMesh &mesh, uint32_t target_triangle_count, float aggressiveness = 7.f);

// Triangle count for a ratio in <0, 1> of the current count, rounded down.
uint32_t target_triangle_count(const IndexedMesh &mesh, float ratio);

} // namespace MeshSlim

#endif // MESHSIMPLIFY_HPP
