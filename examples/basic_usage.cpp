//examples/basic_usage.cpp
#include "../include/face_finder.hpp"
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    try {
        // Optional JSON config file as the only argument
        FinderConfig config;
        if (argc > 1) {
            config = loadFinderConfig(argv[1]);
        }

        auto store = std::make_shared<LogFaceStore>(config);
        FaceFinder finder(store, config);

        // Seed the store with some random faces
        RandomGenerator rng(42);
        for (int i = 0; i < 1000; ++i) {
            finder.resolve(rng.generateFace());
        }

        // Resolve a new face and print its neighbors
        Face query(12, 340, 560);
        auto results = finder.resolveWithDistances(query);

        std::cout << "Most similar faces to " << query.toString() << ":" << std::endl;
        for (const auto& neighbor : results) {
            std::cout << "  " << neighbor.face.toString()
                      << ": squared distance = " << neighbor.distance << std::endl;
        }

        json stats = finder.getStatistics();
        std::cout << "Statistics: " << stats.dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
