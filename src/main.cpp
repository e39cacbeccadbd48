#include "finder/periodic_ring_finder.h"
#include "finder/ring_finder.h"
#include "graph/graph.h"
#include "io/fixtures.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void usage() {
    std::cerr << "usage: ring_finder EDGES COORDS [CELL_X CELL_Y]"
                 " [--radius R] [--verbose] [--rings]\n";
}

} // namespace

int main(int argc, char** argv) {
    // ── Parse arguments ─────────────────────────────────────────
    std::vector<std::string> positional;
    rings::RingFinderOptions options;
    bool print_rings = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--rings") == 0) {
            print_rings = true;
        } else if (std::strcmp(argv[i], "--radius") == 0 && i + 1 < argc) {
            options.image_radius = std::atoi(argv[++i]);
        } else {
            positional.emplace_back(argv[i]);
        }
    }
    if (positional.size() != 2 && positional.size() != 4) {
        usage();
        return EXIT_FAILURE;
    }

    try {
        // ── Read network ────────────────────────────────────────
        rings::Graph graph(rings::read_edge_list(positional[0]));
        auto coords = std::make_shared<const rings::CoordMap>(
            rings::read_coordinates(positional[1]));

        std::optional<rings::Vec2> cell;
        if (positional.size() == 4) {
            cell = rings::Vec2{std::stod(positional[2]), std::stod(positional[3])};
        }

        std::cout << "network: " << graph.num_nodes() << " nodes, "
                  << graph.num_edges() << " edges"
                  << (cell ? " (periodic)" : "") << '\n';

        auto t0 = std::chrono::steady_clock::now();

        // ── Find rings ──────────────────────────────────────────
        std::unique_ptr<rings::RingFinder> finder;
        if (cell) {
            finder = std::make_unique<rings::PeriodicRingFinder>(
                graph, coords, *cell, options);
        } else {
            finder = std::make_unique<rings::RingFinder>(graph, coords, options);
        }

        auto t1 = std::chrono::steady_clock::now();

        // ── Output ──────────────────────────────────────────────
        std::cout << finder->current_rings().size() << " rings, "
                  << finder->perimeter_rings().size() << " perimeter loops\n";
        for (const auto& [size, count] : finder->ring_size_histogram()) {
            std::cout << "  size " << size << ": " << count << '\n';
        }

        if (print_rings) {
            std::vector<std::string> lines;
            for (const auto& ring : finder->current_rings()) {
                lines.push_back(ring.to_string());
            }
            std::sort(lines.begin(), lines.end());
            for (const auto& line : lines) std::cout << line << '\n';
        }

        std::cout << "total: "
                  << std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count()
                  << " µs\n";
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
