// include/face_finder.hpp

#pragma once
#include "../src/core/face.hpp"
#include "../src/core/kd_tree.hpp"
#include "../src/core/face_finder.hpp"
#include "../src/algorithms/nearest_neighbor.hpp"
#include "../src/features/dataset_cache.hpp"
#include "../src/features/face_store.hpp"
#include "../src/features/finder_config.hpp"
#include "../src/features/log_face_store.hpp"
#include "../src/utils/distance_metrics.hpp"
#include "../src/utils/random_generator.hpp"
