#ifndef AIDCLUSTER_MODEL_IO_HPP
#define AIDCLUSTER_MODEL_IO_HPP

#include "dbscan.hpp"
#include "hierarchical.hpp"
#include "kmeans.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace aidcluster {

// Blob layout, all integers little-endian:
//   [magic "ACMD": 4B] [kind: 1B] [version: 2B] [payload_len: 4B]
//   [payload: payload_len B] [crc32c: 4B]
// CRC32C covers every byte before the trailer. Doubles are stored as their
// IEEE-754 bit pattern, so decoded models are bit-identical.

enum class ModelKind : uint8_t { KMeans = 1, MergeTree = 2, Density = 3 };

static constexpr uint16_t kModelFormatVersion = 1;
static constexpr size_t kModelHeaderSize = 11;
static constexpr size_t kModelCrcSize = 4;

std::string encode_model(const KMeansModel& model);
std::string encode_model(const MergeTree& tree);
std::string encode_model(const DensityModel& model);

// Kind of a blob whose framing and checksum verify; throws otherwise.
ModelKind peek_model_kind(const std::string& blob);

// Each throws std::runtime_error on a bad magic, version, kind, length or
// checksum, or a payload that does not describe a valid model.
KMeansModel decode_kmeans(const std::string& blob);
MergeTree decode_tree(const std::string& blob);
DensityModel decode_density(const std::string& blob);

void write_blob(const std::string& path, const std::string& blob);
std::string read_blob(const std::string& path);

}  // namespace aidcluster

#endif  // AIDCLUSTER_MODEL_IO_HPP
