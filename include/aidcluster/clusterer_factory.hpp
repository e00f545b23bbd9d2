#ifndef AIDCLUSTER_CLUSTERER_FACTORY_HPP
#define AIDCLUSTER_CLUSTERER_FACTORY_HPP

#include "iclusterer.hpp"
#include "kmeans.hpp"

#include <memory>
#include <string>
#include <vector>

namespace aidcluster {

// Creates clusterers by name, case-insensitive:
//   kmeans | centroid, hierarchical | ward, dbscan | density.
class ClustererFactory {
public:
    // Throws ConfigurationError naming "algorithm" for unknown names.
    static std::unique_ptr<IClusterer> create(const std::string& algorithm,
                                              const TrainConfig& train = {});

    static bool is_valid_algorithm(const std::string& algorithm);

    // Canonical names, one per variant.
    static std::vector<std::string> available_algorithms();
};

}  // namespace aidcluster

#endif  // AIDCLUSTER_CLUSTERER_FACTORY_HPP
