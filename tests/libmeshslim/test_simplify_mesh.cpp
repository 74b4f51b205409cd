#include <catch2/catch.hpp>

#include <limits>
#include <stdexcept>

#include "libmeshslim/SimplifyMesh.hpp"
#include "libmeshslim/Subdivide.hpp"
#include "libmeshslim/Exception.hpp"

#include "test_meshes.hpp"

using namespace MeshSlim;

static void check_mesh_consistency(const IndexedMesh &mesh)
{
    REQUIRE(mesh.indices.size() % 3 == 0);
    for (uint32_t idx : mesh.indices)
        REQUIRE(idx < mesh.positions.size());

    REQUIRE(mesh.normals.size() == mesh.positions.size());
    for (const Vec3f &n : mesh.normals) {
        REQUIRE(n.allFinite());
        float len = n.norm();
        CHECK((std::abs(len - 1.f) < 1e-4f || len == 0.f));
    }
}

static bool inside(const BoundingBoxf3 &bb, const IndexedMesh &mesh)
{
    for (const Vec3f &p : mesh.positions)
        if (! bb.contains(p))
            return false;
    return true;
}

TEST_CASE("Simplify the unit box", "[Simplify]") {
    IndexedMesh box = make_unit_box();
    BoundingBoxf3 bb = box.bounding_box().inflated(1e-3f);

    SimplifyStats stats;
    SimplifyConfig cfg;
    cfg.aggressiveness = 7.f;
    simplify_mesh(box, 2, cfg, &stats);

    CHECK(box.triangle_count() <= 12);
    CHECK(box.triangle_count() >= 2);
    CHECK(stats.passes <= cfg.max_passes);
    CHECK(stats.triangles_before == 12);
    CHECK(stats.vertices_before == 8);
    CHECK(stats.triangles_after == box.triangle_count());
    CHECK(stats.vertices_after == box.vertex_count());
    CHECK(inside(bb, box));
    check_mesh_consistency(box);
}

TEST_CASE("Simplify a subdivided box", "[Simplify]") {
    IndexedMesh box = make_unit_box();
    split_triangles(box, 2);
    REQUIRE(box.triangle_count() == 108);
    BoundingBoxf3 bb = box.bounding_box().inflated(1e-3f);

    SimplifyStats stats;
    simplify_mesh(box, 12, {}, &stats);

    CHECK(box.triangle_count() < 108);
    CHECK(box.triangle_count() >= 12);
    CHECK(stats.collapses > 0);
    CHECK(stats.passes > 0);
    CHECK(stats.last_threshold > 0.);
    CHECK(stats.triangles_after == box.triangle_count());
    CHECK(inside(bb, box));
    check_mesh_consistency(box);
}

TEST_CASE("Simplify an open flat grid", "[Simplify]") {
    IndexedMesh grid = test::make_grid(10);
    REQUIRE(grid.triangle_count() == 200);
    BoundingBoxf3 bb = grid.bounding_box().inflated(1e-3f);

    uint32_t target = target_triangle_count(grid, 0.25f);
    REQUIRE(target == 50);

    simplify_mesh(grid, target);

    CHECK(grid.triangle_count() < 200);
    CHECK(grid.triangle_count() >= target);
    CHECK(inside(bb, grid));
    check_mesh_consistency(grid);

    // The plane stays flat and keeps facing up.
    for (const Vec3f &p : grid.positions)
        CHECK(std::abs(p.z()) < 1e-4f);
    for (size_t i = 0; i < grid.triangle_count(); ++ i) {
        Vec3f n = face_normal(grid, i);
        if (n != Vec3f::Zero())
            CHECK(n.z() > 0.99f);
    }
}

TEST_CASE("Target above the triangle count keeps the mesh", "[Simplify]") {
    IndexedMesh box = make_unit_box();
    IndexedMesh reference = box;
    box.normals.clear();

    int status = -1;
    SimplifyStats stats;
    stats.collapses = 42;
    simplify_mesh(box, 12, {}, &stats, nullptr, [&status](int s) { status = s; });

    CHECK(box.positions == reference.positions);
    CHECK(box.indices == reference.indices);
    CHECK(box.normals.size() == box.positions.size());
    CHECK(status == 100);
    CHECK(stats.triangles_before == 12);
    CHECK(stats.triangles_after == 12);
    CHECK(stats.collapses == 0);
    CHECK(stats.passes == 0);

    for (float aggressiveness : { 1.f, 7.f, 20.f }) {
        IndexedMesh copy = simplified(reference, 100, aggressiveness);
        CHECK(copy.positions == reference.positions);
        CHECK(copy.indices == reference.indices);
    }
}

TEST_CASE("Simplified returns a reduced copy", "[Simplify]") {
    IndexedMesh grid = test::make_grid(8);
    IndexedMesh reduced = simplified(grid, 16);

    CHECK(grid.triangle_count() == 128);
    CHECK(reduced.triangle_count() < 128);
    CHECK(reduced.triangle_count() >= 16);
    check_mesh_consistency(reduced);
}

TEST_CASE("Simplify reports progress", "[Simplify]") {
    IndexedMesh box = make_unit_box();
    split_triangles(box, 1);

    std::vector<int> statuses;
    simplify_mesh(box, 12, {}, nullptr, nullptr, [&statuses](int s) { statuses.emplace_back(s); });

    REQUIRE(! statuses.empty());
    CHECK(statuses.back() == 100);
    for (size_t i = 0; i < statuses.size(); ++ i) {
        CHECK(statuses[i] >= 0);
        CHECK(statuses[i] <= 100);
        if (i > 0)
            CHECK(statuses[i] >= statuses[i - 1]);
    }
}

TEST_CASE("Cancelled simplification leaves the mesh untouched", "[Simplify]") {
    IndexedMesh box = make_unit_box();
    split_triangles(box, 1);
    IndexedMesh reference = box;

    int calls = 0;
    auto throw_on_cancel = [&calls]() {
        if (++ calls == 2)
            throw std::runtime_error("cancelled");
    };

    CHECK_THROWS_AS(simplify_mesh(box, 2, {}, nullptr, throw_on_cancel), std::runtime_error);
    CHECK(calls == 2);
    CHECK(box.positions == reference.positions);
    CHECK(box.indices == reference.indices);
}

TEST_CASE("Simplify rejects invalid input", "[Simplify]") {
    IndexedMesh box = make_unit_box();

    SECTION("Index past the vertex array") {
        box.indices.back() = 100;
        IndexedMesh reference = box;
        CHECK_THROWS_AS(simplify_mesh(box, 2), InvalidMeshError);
        CHECK(box.indices == reference.indices);
    }

    SECTION("Index count not a multiple of three") {
        box.indices.push_back(0);
        CHECK_THROWS_AS(simplify_mesh(box, 2), InvalidMeshError);
    }

    SECTION("Bad configuration") {
        SimplifyConfig cfg;
        SECTION("aggressiveness") { cfg.aggressiveness = 0.f; }
        SECTION("NaN aggressiveness") { cfg.aggressiveness = std::numeric_limits<float>::quiet_NaN(); }
        SECTION("max_passes") { cfg.max_passes = 0; }
        SECTION("refresh_interval") { cfg.refresh_interval = -1; }
        SECTION("threshold_scale") { cfg.threshold_scale = 0.; }

        CHECK_THROWS_AS(validate(cfg), InvalidArgument);
        CHECK_THROWS_AS(simplify_mesh(box, 2, cfg), InvalidArgument);
    }

    SECTION("Ratio out of range") {
        CHECK_THROWS_AS(target_triangle_count(box, 1.5f), InvalidArgument);
        CHECK_THROWS_AS(target_triangle_count(box, -0.1f), InvalidArgument);
        CHECK(target_triangle_count(box, 0.5f) == 6);
        CHECK(target_triangle_count(box, 0.f) == 0);
    }
}

TEST_CASE("Degenerate triangles do not break the simplification", "[Simplify]") {
    IndexedMesh box = make_unit_box();
    split_triangles(box, 1);
    // Triangle with a repeated vertex, its edge (0, 0) is never collapsed.
    box.indices.insert(box.indices.end(), { 0, 0, 1 });

    REQUIRE_NOTHROW(simplify_mesh(box, 6));
    check_mesh_consistency(box);
}

TEST_CASE("Empty mesh simplifies to an empty mesh", "[Simplify]") {
    IndexedMesh mesh;
    REQUIRE_NOTHROW(simplify_mesh(mesh, 0));
    CHECK(mesh.triangle_count() == 0);
    CHECK(mesh.normals.empty());
}

TEST_CASE("Simplify a custom mesh type", "[Simplify]") {
    using Engine = SimplifyMesh::implementation::SimplifiableMesh<test::SoupMesh>;

    test::SoupMesh soup = test::to_soup(test::make_grid(10));

    Engine sm{soup};

    size_t mixed_collapses = 0, collapses = 0;
    sm.set_collapse_observer([&](size_t kept, size_t removed) {
        ++ collapses;
        if (sm.is_border(kept) != sm.is_border(removed))
            ++ mixed_collapses;
    });

    REQUIRE(sm.live_face_count() == 200);
    sm.simplify_mesh(50);
    CHECK(sm.live_face_count() == sm.stats().triangles_after);

    test::SoupMesh out;
    sm.extract(out);

    CHECK(collapses > 0);
    CHECK(collapses == sm.stats().collapses);
    CHECK(mixed_collapses == 0);
    CHECK(out.faces.size() < soup.faces.size());
    CHECK(out.faces.size() >= 50);
    CHECK(out.faces.size() == sm.stats().triangles_after);
    CHECK(out.points.size() == sm.stats().vertices_after);

    for (const SimplifyMesh::Index3 &t : out.faces)
        for (size_t idx : t)
            REQUIRE(idx < out.points.size());

    // The outline of the grid is detected as border.
    CHECK(sm.is_border(0));
    CHECK(sm.is_border(10));
    CHECK(! sm.is_border(12));
}

TEST_CASE("Engine is single use", "[Simplify]") {
    using Engine = SimplifyMesh::implementation::SimplifiableMesh<test::SoupMesh>;
    test::SoupMesh soup = test::to_soup(make_unit_box());
    test::SoupMesh out;

    SECTION("Extract before simplify") {
        Engine sm{soup};
        CHECK_THROWS_AS(sm.extract(out), LogicError);
    }

    SECTION("Simplify twice") {
        Engine sm{soup};
        sm.simplify_mesh(2);
        CHECK_THROWS_AS(sm.simplify_mesh(2), LogicError);
    }

    SECTION("Extract twice") {
        Engine sm{soup};
        sm.simplify_mesh(2);
        REQUIRE_NOTHROW(sm.extract(out));
        CHECK_THROWS_AS(sm.extract(out), LogicError);
    }
}
