#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <thread>
#include <vector>

#include "../src/algorithms/nearest_neighbor.hpp"
#include "../src/core/kd_tree.hpp"
#include "../src/utils/distance_metrics.hpp"
#include "../src/utils/random_generator.hpp"

namespace {

constexpr size_t K = NearestNeighborSearch::RESULT_COUNT;

// The `count` smallest squared distances from query over faces.
std::vector<int64_t> bruteForceDistances(const Face& query, const std::vector<Face>& faces,
                                         size_t count) {
    std::vector<int64_t> distances;
    for (const auto& face : faces) {
        distances.push_back(squaredDistance(query, face));
    }
    std::sort(distances.begin(), distances.end());
    distances.resize(std::min(count, distances.size()));
    return distances;
}

std::vector<int64_t> distancesOf(const std::vector<Neighbor>& neighbors, size_t skip = 0) {
    std::vector<int64_t> distances;
    for (size_t i = skip; i < neighbors.size(); ++i) {
        distances.push_back(neighbors[i].distance);
    }
    return distances;
}

std::vector<Face> clusteredFaces(size_t count, unsigned int seed) {
    // Narrow ranges so many faces share axis values and distances.
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> small(40, 45);
    std::vector<Face> faces;
    for (size_t i = 0; i < count; ++i) {
        faces.emplace_back(small(gen), small(gen) * 10, small(gen), static_cast<int64_t>(i + 1));
    }
    return faces;
}

// Eleven stored faces; the tests query them with (11, 11, 11).
std::vector<Face> exampleFaces() {
    return {
        Face(10, 10, 10, 1),   Face(90, 900, 900, 2), Face(15, 20, 15, 3),
        Face(50, 500, 500, 4), Face(12, 11, 14, 5),   Face(13, 9, 16, 6),
        Face(60, 600, 600, 7), Face(14, 18, 17, 8),   Face(55, 550, 550, 9),
        Face(16, 12, 13, 10),  Face(17, 19, 18, 11)
    };
}

std::vector<int64_t> idsOf(const std::vector<Neighbor>& neighbors) {
    std::vector<int64_t> ids;
    for (const auto& n : neighbors) {
        ids.push_back(n.face.id());
    }
    return ids;
}

}  // namespace

class NearestNeighborTest : public ::testing::Test {
protected:
    NearestNeighborSearch searcher;
};

// ============================================================================
// Known layouts
// ============================================================================

TEST_F(NearestNeighborTest, ResolvesStoredQueryInExampleDataset) {
    auto faces = exampleFaces();
    Face query(11, 11, 11, 12);
    faces.push_back(query);

    auto tree = KDTree::build(faces);
    ASSERT_NE(tree.get(), nullptr);

    SearchTrace trace;
    auto result = searcher.search(query, tree.get(), faces, &trace);
    EXPECT_TRUE(trace.used_tree);

    EXPECT_EQ(idsOf(result), (std::vector<int64_t>{12, 1, 5, 10, 6}));
    EXPECT_EQ(distancesOf(result), (std::vector<int64_t>{0, 3, 10, 30, 33}));
}

TEST_F(NearestNeighborTest, LinearScanMatchesExample) {
    auto faces = exampleFaces();
    Face query(11, 11, 11, 12);
    faces.push_back(query);

    SearchTrace trace;
    auto result = searcher.search(query, nullptr, faces, &trace);
    EXPECT_FALSE(trace.used_tree);
    EXPECT_EQ(trace.points_examined, faces.size());
    EXPECT_EQ(idsOf(result), (std::vector<int64_t>{12, 1, 5, 10, 6}));
}

TEST_F(NearestNeighborTest, UnsavedQueryIsPrepended) {
    auto faces = exampleFaces();
    auto tree = KDTree::build(faces);
    ASSERT_NE(tree.get(), nullptr);

    Face query(11, 11, 11);
    auto result = searcher.search(query, tree.get(), faces);
    ASSERT_EQ(result.size(), K);
    EXPECT_EQ(result[0].face, query);
    EXPECT_EQ(result[0].distance, 0);
    EXPECT_EQ((std::vector<int64_t>{result[1].face.id(), result[2].face.id(),
                                    result[3].face.id(), result[4].face.id()}),
              (std::vector<int64_t>{1, 5, 10, 6}));
}

TEST_F(NearestNeighborTest, KnownQueryMissingFromDatasetIsPrepended) {
    auto faces = exampleFaces();
    auto tree = KDTree::build(faces);
    Face query(90, 900, 900, 77);

    auto result = searcher.search(query, tree.get(), faces);
    ASSERT_EQ(result.size(), K);
    EXPECT_EQ(result[0].face.id(), 77);
    EXPECT_EQ(result[1].face.id(), 2);
    EXPECT_EQ(result[1].distance, 0);
}

// ============================================================================
// Small datasets (no tree)
// ============================================================================

TEST_F(NearestNeighborTest, FallsBackOneShortOfThreshold) {
    RandomGenerator rng(11);
    auto faces = rng.generateFaces(KDTree::MIN_POINTS * 2 + 2);
    auto tree = KDTree::build(faces);
    EXPECT_EQ(tree.get(), nullptr);

    Face query = faces[3];
    SearchTrace trace;
    auto result = searcher.search(query, tree.get(), faces, &trace);
    EXPECT_FALSE(trace.used_tree);
    ASSERT_EQ(result.size(), K);
    EXPECT_EQ(result[0].face, query);
    EXPECT_EQ(distancesOf(result), bruteForceDistances(query, faces, K));
}

TEST_F(NearestNeighborTest, TinyDatasetReturnsFewerResults) {
    std::vector<Face> faces{Face(1, 1, 1, 1), Face(2, 2, 2, 2)};
    Face query(0, 0, 0);
    auto result = searcher.search(query, nullptr, faces);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].face, query);
    EXPECT_EQ(result[1].face.id(), 1);
    EXPECT_EQ(result[2].face.id(), 2);
}

TEST_F(NearestNeighborTest, EmptyDatasetReturnsQueryOnly) {
    Face query(5, 5, 5, 3);
    auto result = searcher.search(query, nullptr, {});
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].face, query);
    EXPECT_EQ(result[0].distance, 0);
}

// ============================================================================
// Agreement with brute force
// ============================================================================

TEST_F(NearestNeighborTest, MatchesBruteForceOnRandomData) {
    RandomGenerator rng(12);
    for (size_t count : {11u, 25u, 200u, 3000u}) {
        auto faces = rng.generateFaces(count);
        auto tree = KDTree::build(faces);
        ASSERT_NE(tree.get(), nullptr);

        for (int i = 0; i < 200; ++i) {
            Face query = rng.generateFace();
            auto result = searcher.search(query, tree.get(), faces);
            ASSERT_EQ(result.size(), K);
            EXPECT_EQ(result[0].face, query);
            EXPECT_EQ(distancesOf(result, 1), bruteForceDistances(query, faces, K - 1))
                << "count=" << count << " query=" << query.toString();
        }
    }
}

TEST_F(NearestNeighborTest, MatchesBruteForceForStoredQueries) {
    RandomGenerator rng(13);
    auto faces = rng.generateFaces(1500);
    auto tree = KDTree::build(faces);
    ASSERT_NE(tree.get(), nullptr);

    for (size_t i = 0; i < faces.size(); i += 7) {
        const Face& query = faces[i];
        auto result = searcher.search(query, tree.get(), faces);
        ASSERT_EQ(result.size(), K);
        EXPECT_EQ(result[0].face, query);
        EXPECT_EQ(distancesOf(result), bruteForceDistances(query, faces, K));
    }
}

TEST_F(NearestNeighborTest, MatchesBruteForceWithHeavyTies) {
    for (unsigned int seed = 1; seed <= 5; ++seed) {
        auto faces = clusteredFaces(400, seed);
        auto tree = KDTree::build(faces);
        ASSERT_NE(tree.get(), nullptr);

        std::mt19937 gen(seed);
        std::uniform_int_distribution<int> pick(0, static_cast<int>(faces.size()) - 1);
        for (int i = 0; i < 50; ++i) {
            const Face& query = faces[pick(gen)];
            auto result = searcher.search(query, tree.get(), faces);
            EXPECT_EQ(distancesOf(result), bruteForceDistances(query, faces, K));
        }
    }
}

TEST_F(NearestNeighborTest, ResultsAreOrderedClosestFirst) {
    RandomGenerator rng(14);
    auto faces = rng.generateFaces(800);
    auto tree = KDTree::build(faces);

    for (int i = 0; i < 100; ++i) {
        auto result = searcher.search(rng.generateFace(), tree.get(), faces);
        auto distances = distancesOf(result);
        EXPECT_TRUE(std::is_sorted(distances.begin(), distances.end()));
    }
}

// ============================================================================
// Pruning and independence
// ============================================================================

TEST_F(NearestNeighborTest, TreeSearchPrunesLargeDataset) {
    RandomGenerator rng(15);
    auto faces = rng.generateFaces(10000);
    auto tree = KDTree::build(faces);
    ASSERT_NE(tree.get(), nullptr);

    size_t examined = 0;
    const int queries = 100;
    for (int i = 0; i < queries; ++i) {
        SearchTrace trace;
        searcher.search(rng.generateFace(), tree.get(), faces, &trace);
        EXPECT_TRUE(trace.used_tree);
        EXPECT_GE(trace.leaves_visited, 1u);
        examined += trace.points_examined;
    }
    EXPECT_LT(examined / queries, faces.size() / 10);
}

TEST_F(NearestNeighborTest, ConcurrentSearchesAgree) {
    RandomGenerator rng(16);
    auto faces = rng.generateFaces(2000);
    auto tree = KDTree::build(faces);
    ASSERT_NE(tree.get(), nullptr);

    std::vector<Face> queries;
    for (int i = 0; i < 64; ++i) {
        queries.push_back(rng.generateFace());
    }

    std::vector<std::vector<int64_t>> expected;
    for (const auto& query : queries) {
        expected.push_back(distancesOf(searcher.search(query, tree.get(), faces)));
    }

    std::vector<std::vector<std::vector<int64_t>>> actual(4);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < actual.size(); ++t) {
        workers.emplace_back([&, t]() {
            for (const auto& query : queries) {
                actual[t].push_back(distancesOf(searcher.search(query, tree.get(), faces)));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& results : actual) {
        EXPECT_EQ(results, expected);
    }
}
