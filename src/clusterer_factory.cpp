#include "aidcluster/clusterer_factory.hpp"
#include "aidcluster/dbscan.hpp"
#include "aidcluster/hierarchical.hpp"

#include <algorithm>
#include <cctype>

namespace aidcluster {

namespace {

enum class Variant { Centroid, Hierarchical, Density, Unknown };

Variant lookup(const std::string& algorithm) {
    std::string name = algorithm;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "kmeans" || name == "centroid") return Variant::Centroid;
    if (name == "hierarchical" || name == "ward") return Variant::Hierarchical;
    if (name == "dbscan" || name == "density") return Variant::Density;
    return Variant::Unknown;
}

}  // namespace

std::unique_ptr<IClusterer> ClustererFactory::create(const std::string& algorithm,
                                                     const TrainConfig& train) {
    switch (lookup(algorithm)) {
    case Variant::Centroid:
        return std::make_unique<CentroidClusterer>(train);
    case Variant::Hierarchical:
        return std::make_unique<HierarchicalClusterer>();
    case Variant::Density:
        return std::make_unique<DensityClusterer>();
    case Variant::Unknown:
        break;
    }
    throw ConfigurationError("algorithm", "unknown clustering algorithm '" + algorithm + "'");
}

bool ClustererFactory::is_valid_algorithm(const std::string& algorithm) {
    return lookup(algorithm) != Variant::Unknown;
}

std::vector<std::string> ClustererFactory::available_algorithms() {
    return {"kmeans", "hierarchical", "dbscan"};
}

}  // namespace aidcluster
