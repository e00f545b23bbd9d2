#include <gtest/gtest.h>
#include "aidcluster/data_generator.hpp"
#include "aidcluster/model_io.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>

using namespace aidcluster;
using namespace aidcluster::testing_util;

TEST(ModelIO, KMeansRoundTripReproducesPredict) {
    FeatureMatrix m = generate_gaussian_mixture(150, 4, 3, 19);
    CentroidClusterer km;
    ClusterAssignment a = km.fit(m, 3);

    std::string blob = encode_model(km.model());
    EXPECT_EQ(peek_model_kind(blob), ModelKind::KMeans);
    KMeansModel decoded = decode_kmeans(blob);
    EXPECT_EQ(decoded.centroids, km.model().centroids);
    EXPECT_EQ(decoded.inertia, km.model().inertia);
    EXPECT_EQ(decoded.seed, 42u);

    CentroidClusterer restored;
    restored.load_model(decoded);
    EXPECT_EQ(restored.predict(m), a.labels);
}

TEST(ModelIO, TreeRoundTripReproducesCuts) {
    FeatureMatrix m = make_uniform(30, 3, 23);
    HierarchicalClusterer hc;
    MergeTree tree = hc.build_tree(m);

    MergeTree decoded = decode_tree(encode_model(tree));
    EXPECT_EQ(decoded.leaf_ids, tree.leaf_ids);
    for (int k = 1; k <= 30; k += 7)
        EXPECT_EQ(HierarchicalClusterer::cut(decoded, k).labels,
                  HierarchicalClusterer::cut(tree, k).labels);
}

TEST(ModelIO, DensityRoundTripReproducesPredict) {
    FeatureMatrix m = make_uniform(60, 2, 29);
    DensityClusterer db;
    db.fit(m, 1.0, 3);

    DensityClusterer restored;
    restored.load_model(decode_density(encode_model(db.model())));
    EXPECT_EQ(restored.predict(m), db.predict(m));
}

TEST(ModelIO, RejectsCorruptBlobs) {
    CentroidClusterer km;
    km.fit(make_two_triples(), 2);
    const std::string blob = encode_model(km.model());

    std::string flipped = blob;
    flipped[kModelHeaderSize + 3] ^= 0x01;
    EXPECT_THROW(decode_kmeans(flipped), std::runtime_error);

    std::string truncated = blob.substr(0, blob.size() - 1);
    EXPECT_THROW(decode_kmeans(truncated), std::runtime_error);

    std::string bad_magic = blob;
    bad_magic[0] = 'X';
    EXPECT_THROW(decode_kmeans(bad_magic), std::runtime_error);

    EXPECT_THROW(decode_tree(blob), std::runtime_error);
    EXPECT_THROW(decode_kmeans(""), std::runtime_error);
}

TEST(ModelIO, FileRoundTrip) {
    DensityClusterer db;
    db.fit(make_two_triples(), 2.0, 2);
    const std::string path = ::testing::TempDir() + "aidcluster_density.bin";
    write_blob(path, encode_model(db.model()));
    DensityModel decoded = decode_density(read_blob(path));
    EXPECT_EQ(decoded.core_labels, db.model().core_labels);
    EXPECT_EQ(decoded.core_points, db.model().core_points);

    EXPECT_THROW(read_blob(::testing::TempDir() + "does/not/exist.bin"), std::runtime_error);
}
