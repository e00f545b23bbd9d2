#include "aidcluster/data_generator.hpp"

#include <random>
#include <string>
#include <utility>

namespace aidcluster {

FeatureMatrix generate_gaussian_mixture(size_t n, size_t dim, int num_gaussians,
                                        unsigned seed, double spread) {
    if (n == 0 || dim == 0 || num_gaussians <= 0 || !(spread > 0.0))
        throw ConfigurationError("generator", "n, dim, num_gaussians and spread must be positive");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> mean_dist(-spread, spread);
    std::uniform_real_distribution<double> scale_dist(0.5, 1.5);

    const size_t g_count = static_cast<size_t>(num_gaussians);
    std::vector<double> centres(g_count * dim);
    std::vector<double> scales(g_count);
    for (size_t g = 0; g < g_count; ++g) {
        scales[g] = scale_dist(rng);
        for (size_t d = 0; d < dim; ++d)
            centres[g * dim + d] = mean_dist(rng);
    }

    std::vector<double> values(n * dim);
    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<std::string> ids;
    ids.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        size_t g = i % g_count;
        const double* c = centres.data() + g * dim;
        double* row = values.data() + i * dim;
        for (size_t d = 0; d < dim; ++d)
            row[d] = c[d] + scales[g] * noise(rng);
        ids.push_back("r" + std::to_string(i));
    }

    std::vector<std::string> names;
    names.reserve(dim);
    for (size_t d = 0; d < dim; ++d) names.push_back("f" + std::to_string(d));

    return FeatureMatrix(std::move(ids), std::move(names), std::move(values));
}

std::vector<int> generate_ground_truth_labels(size_t n, int num_gaussians) {
    std::vector<int> labels(n);
    for (size_t i = 0; i < n; ++i)
        labels[i] = static_cast<int>(i % static_cast<size_t>(num_gaussians));
    return labels;
}

}  // namespace aidcluster
