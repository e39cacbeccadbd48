/// Integration tests for PeriodicRingFinder.
///
///   - Strip closed in x only (three squares, two boundary loops)
///   - Fully periodic 3×3 grid (nine squares, no perimeter)
///   - Unwrapped per-ring coordinates, image radius, folded inputs
///   - Invalid cells / radii
///   - Minimum-image wrap vectors and the closed-ring wrap sum

#include "finder/periodic_ring_finder.h"
#include "finder/periodic_wrap.h"
#include "graph/graph.h"
#include "error.h"

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <utility>
#include <vector>

using namespace rings;

static Graph make_graph(const std::vector<std::pair<NodeId, NodeId>>& edges) {
    Graph g;
    for (auto [u, v] : edges) g.add_edge(u, v);
    return g;
}

/// Two squares closed into a ring of three by wrap edges 5–1 and 4–0.
static Graph three_squares_graph() {
    return make_graph({{0, 1}, {1, 2}, {2, 3}, {3, 0}, {2, 5},
                       {4, 5}, {3, 4}, {5, 1}, {4, 0}});
}

static CoordMap three_squares_coords() {
    return {{0, {0.0, 0.0}}, {1, {0.0, 1.0}}, {2, {1.0, 1.0}},
            {3, {1.0, 0.0}}, {4, {2.0, 0.0}}, {5, {2.0, 1.0}}};
}

/// 3×3 grid of nodes with full wrap-around in both directions.
static Graph grid_graph() {
    return make_graph({{0, 1}, {1, 2}, {2, 3}, {3, 0}, {2, 5},
                       {4, 5}, {3, 4}, {5, 1}, {4, 0},
                       {1, 6}, {2, 7}, {5, 8},
                       {6, 0}, {7, 3}, {8, 4},
                       {8, 6}, {8, 7}, {7, 6}});
}

static CoordMap grid_coords() {
    return {{0, {0.0, 0.0}}, {1, {0.0, 1.0}}, {2, {1.0, 1.0}},
            {3, {1.0, 0.0}}, {4, {2.0, 0.0}}, {5, {2.0, 1.0}},
            {6, {0.0, 2.0}}, {7, {1.0, 2.0}}, {8, {2.0, 2.0}}};
}

// ════════════════════════════════════════════════════════════════════
//  Scenarios
// ════════════════════════════════════════════════════════════════════

static void test_three_squares() {
    std::printf("  periodic: two squares wrap into three\n");

    PeriodicRingFinder rf(three_squares_graph(),
                          std::make_shared<const CoordMap>(three_squares_coords()),
                          {2.5, 2.5});
    assert(rf.current_rings().size() == 3);
    for (const auto& ring : rf.current_rings()) assert(ring.size() == 4);

    // The ring across the boundary is reported with unwrapped
    // coordinates: node 0 stays in the origin cell, 4 and 5 sit one
    // cell to the left, so the square is 0.5 wide.
    Shape wrapped({{0, 1}, {1, 5}, {5, 4}, {4, 0}});
    auto it = rf.current_rings().find(wrapped);
    assert(it != rf.current_rings().end());
    assert(it->has_coordinates());
    assert((it->coordinates()->at(0) == Vec2{0.0, 0.0}));
    assert((it->coordinates()->at(4) == Vec2{-0.5, 0.0}));
    assert((it->coordinates()->at(5) == Vec2{-0.5, 1.0}));
    assert(std::abs(it->area() - 0.5) < 1e-12);
    assert((it->to_node_list() == std::vector<NodeId>{0, 1, 5, 4}));

    // Periodic in x only: the top and bottom rows are left over as two
    // open boundary loops.
    assert(rf.perimeter_rings().size() == 2);
    for (const auto& loop : rf.perimeter_rings()) {
        assert(loop.size() == 3);
        assert(!loop.has_coordinates());
    }
    assert(rf.perimeter_rings().count(Shape({{1, 2}, {2, 5}, {5, 1}})));
    assert(rf.perimeter_rings().count(Shape({{0, 3}, {3, 4}, {4, 0}})));
}

static void test_2d_squares() {
    std::printf("  periodic: 3x3 grid on a torus\n");

    PeriodicRingFinder rf(grid_graph(),
                          std::make_shared<const CoordMap>(grid_coords()),
                          {3.0, 3.0});
    assert(rf.current_rings().size() == 9);

    double total_area = 0.0;
    for (const auto& ring : rf.current_rings()) {
        assert(ring.size() == 4);
        total_area += ring.area();
    }
    // The rings tile the unit cell exactly.
    assert(std::abs(total_area - 9.0) < 1e-9);

    // Every edge is shared by two rings: nothing is left on a perimeter.
    assert(rf.perimeter_rings().empty());

    auto histogram = rf.ring_size_histogram();
    assert(histogram.size() == 1 && histogram.at(4) == 9);
}

static void test_one_ring_without_wrap() {
    std::printf("  periodic: isolated hexagon in a large cell\n");

    Graph g;
    CoordMap coords;
    for (NodeId i = 0; i < 6; ++i) {
        g.add_edge(i, (i + 1) % 6);
        const double a = static_cast<double>(i) * 3.14159265358979323846 / 3.0;
        coords[i] = {5.0 + std::cos(a), 5.0 + std::sin(a)};
    }
    PeriodicRingFinder rf(g, std::make_shared<const CoordMap>(coords), {10.0, 10.0});
    assert(rf.current_rings().size() == 1);
    assert(rf.current_rings().begin()->size() == 6);
    assert(rf.perimeter_rings().size() == 1);
}

// ════════════════════════════════════════════════════════════════════
//  Options and input handling
// ════════════════════════════════════════════════════════════════════

static void test_wider_image_radius() {
    std::printf("  periodic: wider tiling finds the same rings\n");

    auto coords = std::make_shared<const CoordMap>(grid_coords());
    PeriodicRingFinder narrow(grid_graph(), coords, {3.0, 3.0});
    PeriodicRingFinder wide(grid_graph(), coords, {3.0, 3.0},
                            RingFinderOptions{.image_radius = 2});
    assert(wide.image_radius() == 2);
    assert(narrow.image_radius() == 1);
    assert(wide.current_rings() == narrow.current_rings());
    assert((wide.cell() == Vec2{3.0, 3.0}));
}

static void test_coordinates_outside_cell() {
    std::printf("  periodic: coordinates are folded into the cell\n");

    CoordMap coords = grid_coords();
    coords[4].x += 3.0;   // one cell to the right
    coords[6].y -= 6.0;   // two cells down
    coords[8] = {-1.0, -1.0};
    PeriodicRingFinder rf(grid_graph(), std::make_shared<const CoordMap>(coords),
                          {3.0, 3.0});
    assert(rf.current_rings().size() == 9);
    for (const auto& ring : rf.current_rings()) {
        assert(ring.size() == 4);
        assert(std::abs(ring.area() - 1.0) < 1e-9);
    }
}

static void test_invalid_cell() {
    std::printf("  periodic: invalid cell and radius rejected\n");

    auto coords = std::make_shared<const CoordMap>(grid_coords());
    const Vec2 bad_cells[] = {{0.0, 3.0}, {3.0, -1.0}, {NAN, 3.0},
                              {3.0, INFINITY}};
    for (const auto& cell : bad_cells) {
        bool threw = false;
        try {
            PeriodicRingFinder rf(grid_graph(), coords, cell);
        } catch (const ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    bool threw = false;
    try {
        PeriodicRingFinder rf(grid_graph(), coords, {3.0, 3.0},
                              RingFinderOptions{.image_radius = 0});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    CoordMap partial = grid_coords();
    partial.erase(7);
    threw = false;
    try {
        PeriodicRingFinder rf(grid_graph(), std::make_shared<const CoordMap>(partial),
                              {3.0, 3.0});
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);
}

static void test_cell_too_small() {
    std::printf("  periodic: ring through two images of one node rejected\n");

    // A ladder with a single rung per cell: rows 0-1-2 and 3-4-5 each
    // close on themselves across the x boundary, joined only by 0–3.
    // The face between neighbouring rungs passes node 0 in two
    // adjacent cells, which a ring of node ids cannot describe.
    Graph ladder = make_graph({{0, 1}, {1, 2}, {2, 0},
                               {3, 4}, {4, 5}, {5, 3},
                               {0, 3}});
    auto coords = std::make_shared<const CoordMap>(CoordMap{
        {0, {0.0, 0.0}}, {1, {0.7, 0.0}}, {2, {1.4, 0.0}},
        {3, {0.0, 1.0}}, {4, {0.7, 1.0}}, {5, {1.4, 1.0}}});

    bool threw = false;
    try {
        PeriodicRingFinder rf(ladder, coords, {2.1, 10.0});
    } catch (const GeometryError&) {
        threw = true;
    }
    assert(threw);

    // With a rung at every node the cell is wide enough for each ring.
    Graph rungs = make_graph({{0, 1}, {1, 2}, {2, 0},
                              {3, 4}, {4, 5}, {5, 3},
                              {0, 3}, {1, 4}, {2, 5}});
    PeriodicRingFinder rf(rungs, coords, {2.1, 10.0});
    assert(rf.current_rings().size() == 3);
    assert(rf.perimeter_rings().size() == 2);
}

// ════════════════════════════════════════════════════════════════════
//  Wrap vectors
// ════════════════════════════════════════════════════════════════════

static WrapMap wrap_map(const Graph& g, const CoordMap& coords, const Vec2& cell) {
    WrapMap wrap;
    for (const auto& e : g.edges()) {
        wrap.emplace(e, minimum_image_wrap(coords.at(e.b) - coords.at(e.a), cell));
    }
    return wrap;
}

static void test_minimum_image_wrap() {
    std::printf("  periodic: edges wrap only past half a cell\n");

    const Vec2 cell{2.5, 2.0};
    assert((minimum_image_wrap({1.25, 0.0}, cell) == ImageOffset{0, 0}));
    assert((minimum_image_wrap({-1.25, 1.0}, cell) == ImageOffset{0, 0}));
    assert((minimum_image_wrap({1.3, 0.0}, cell) == ImageOffset{-1, 0}));
    assert((minimum_image_wrap({-1.3, -1.5}, cell) == ImageOffset{1, 1}));
    assert((minimum_image_wrap({0.2, 1.9}, cell) == ImageOffset{0, -1}));

    // A unit square whose sides are exactly half the cell is not
    // wrapped: it is one ring, not a set of strips.
    Graph g = make_graph({{0, 1}, {1, 2}, {2, 3}, {3, 0}});
    auto coords = std::make_shared<const CoordMap>(CoordMap{
        {0, {0.0, 0.0}}, {1, {1.0, 0.0}}, {2, {1.0, 1.0}}, {3, {0.0, 1.0}}});
    PeriodicRingFinder rf(g, coords, {2.0, 2.0});
    assert(rf.current_rings().size() == 1);
    const Shape& ring = *rf.current_rings().begin();
    assert(std::abs(ring.area() - 1.0) < 1e-12);
    assert((ring.to_node_list() == std::vector<NodeId>{0, 1, 2, 3}));
    assert(rf.perimeter_rings().size() == 1);
}

static void test_wrap_sum() {
    std::printf("  periodic: wrap vectors cancel only around closed rings\n");

    const CoordMap coords = three_squares_coords();
    const WrapMap wrap = wrap_map(three_squares_graph(), coords, {2.5, 2.5});
    assert((wrap.at(Edge(0, 4)) == ImageOffset{-1, 0}));
    assert((wrap.at(Edge(1, 5)) == ImageOffset{-1, 0}));
    assert((wrap.at(Edge(2, 3)) == ImageOffset{0, 0}));

    // The square across the boundary closes.
    assert((wrap_sum({0, 1, 5, 4}, wrap) == ImageOffset{0, 0}));
    check_wrap_sum({0, 1, 5, 4}, wrap);
    check_wrap_sum({0, 1, 2, 3}, wrap);

    // The bottom row winds once around the cell, in either direction.
    assert((wrap_sum({0, 3, 4}, wrap) == ImageOffset{1, 0}));
    assert((wrap_sum({4, 3, 0}, wrap) == ImageOffset{-1, 0}));
    bool threw = false;
    try {
        check_wrap_sum({0, 3, 4}, wrap);
    } catch (const GeometryError&) {
        threw = true;
    }
    assert(threw);

    // Stepping between nodes that are not joined.
    threw = false;
    try {
        check_wrap_sum({0, 2, 3}, wrap);
    } catch (const GeometryError&) {
        threw = true;
    }
    assert(threw);

    // Every ring the finder reports closes.
    PeriodicRingFinder rf(three_squares_graph(),
                          std::make_shared<const CoordMap>(coords), {2.5, 2.5});
    for (const auto& r : rf.current_rings()) {
        assert((wrap_sum(r.to_node_list(), wrap) == ImageOffset{0, 0}));
    }
}

// ════════════════════════════════════════════════════════════════════
//  main
// ════════════════════════════════════════════════════════════════════

int main() {
    std::printf("=== PeriodicRingFinder tests ===\n\n");

    test_three_squares();
    test_2d_squares();
    test_one_ring_without_wrap();
    test_wider_image_radius();
    test_coordinates_outside_cell();
    test_invalid_cell();
    test_cell_too_small();
    test_minimum_image_wrap();
    test_wrap_sum();

    std::printf("\nAll %d tests passed.\n", 9);
    return 0;
}
