// benchmarks/search_benchmark.cpp
#include "../src/algorithms/nearest_neighbor.hpp"
#include "../src/core/kd_tree.hpp"
#include "../src/utils/random_generator.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

void benchmark_search(size_t num_faces, size_t num_queries) {
    RandomGenerator rng(7);
    std::vector<Face> faces = rng.generateFaces(num_faces);

    auto start = std::chrono::high_resolution_clock::now();
    auto tree = KDTree::build(faces);
    auto end = std::chrono::high_resolution_clock::now();
    auto build_duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    // Generate queries
    std::vector<Face> queries;
    for (size_t i = 0; i < num_queries; ++i) {
        queries.push_back(rng.generateFace());
    }

    NearestNeighborSearch searcher;
    size_t examined_tree = 0;
    size_t examined_scan = 0;

    // Benchmark tree search
    start = std::chrono::high_resolution_clock::now();
    for (const auto& query : queries) {
        SearchTrace trace;
        searcher.search(query, tree.get(), faces, &trace);
        examined_tree += trace.points_examined;
    }
    end = std::chrono::high_resolution_clock::now();
    auto tree_duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    // Benchmark linear scan
    start = std::chrono::high_resolution_clock::now();
    for (const auto& query : queries) {
        SearchTrace trace;
        searcher.search(query, nullptr, faces, &trace);
        examined_scan += trace.points_examined;
    }
    end = std::chrono::high_resolution_clock::now();
    auto scan_duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    std::cout << "Faces: " << num_faces << ", Queries: " << num_queries << std::endl;
    std::cout << "Tree build time: " << build_duration.count() << " us"
              << " (height " << (tree ? tree->height() : 0) << ")" << std::endl;
    std::cout << "Tree search time: " << tree_duration.count() << " us, "
              << examined_tree / num_queries << " points examined per query" << std::endl;
    std::cout << "Linear scan time: " << scan_duration.count() << " us, "
              << examined_scan / num_queries << " points examined per query" << std::endl;
    if (tree_duration.count() > 0) {
        std::cout << "Speedup: " << static_cast<double>(scan_duration.count()) / tree_duration.count()
                  << "x" << std::endl;
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    size_t num_queries = (argc > 1) ? std::stoul(argv[1]) : 1000;
    if (num_queries == 0) num_queries = 1;
    for (size_t num_faces : {100, 1000, 10000}) {
        benchmark_search(num_faces, num_queries);
    }
    return 0;
}
