#include "aidcluster/model_io.hpp"
#include "aidcluster/log.hpp"

#include "absl/crc/crc32c.h"
#include "absl/strings/string_view.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

namespace aidcluster {

namespace {

constexpr char kMagic[4] = {'A', 'C', 'M', 'D'};

uint32_t crc_of(const std::string& buf, size_t len) {
    return static_cast<uint32_t>(absl::ComputeCrc32c(absl::string_view(buf.data(), len)));
}

class BlobWriter {
public:
    void u8(uint8_t v) { buf_.push_back(static_cast<char>(v)); }
    void u16(uint16_t v) { put_le(v, 2); }
    void u32(uint32_t v) { put_le(v, 4); }
    void u64(uint64_t v) { put_le(v, 8); }
    void i32(int v) { u32(static_cast<uint32_t>(v)); }
    void f64(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, 8);
        u64(bits);
    }
    void str(const std::string& s) {
        u32(static_cast<uint32_t>(s.size()));
        buf_.append(s);
    }

    std::string& buffer() { return buf_; }

private:
    void put_le(uint64_t v, int bytes) {
        for (int b = 0; b < bytes; ++b)
            buf_.push_back(static_cast<char>((v >> (8 * b)) & 0xff));
    }

    std::string buf_;
};

class BlobReader {
public:
    BlobReader(const std::string& buf, size_t pos, size_t end) : buf_(buf), pos_(pos), end_(end) {}

    uint8_t u8() { return static_cast<uint8_t>(get_le(1)); }
    uint16_t u16() { return static_cast<uint16_t>(get_le(2)); }
    uint32_t u32() { return static_cast<uint32_t>(get_le(4)); }
    uint64_t u64() { return get_le(8); }
    int i32() { return static_cast<int>(u32()); }
    double f64() {
        uint64_t bits = u64();
        double v;
        std::memcpy(&v, &bits, 8);
        return v;
    }
    std::string str() {
        uint32_t len = u32();
        need(len);
        std::string s = buf_.substr(pos_, len);
        pos_ += len;
        return s;
    }

    // Element count that must fit in the remaining bytes at elem_size each.
    size_t count(size_t elem_size) {
        uint64_t n = u64();
        if (elem_size > 0 && n > (end_ - pos_) / elem_size)
            throw std::runtime_error("model blob: element count exceeds payload");
        return static_cast<size_t>(n);
    }

    bool done() const { return pos_ == end_; }

private:
    void need(size_t n) const {
        if (end_ - pos_ < n)
            throw std::runtime_error("model blob: truncated payload");
    }

    uint64_t get_le(int bytes) {
        need(static_cast<size_t>(bytes));
        uint64_t v = 0;
        for (int b = 0; b < bytes; ++b)
            v |= static_cast<uint64_t>(static_cast<uint8_t>(buf_[pos_ + b])) << (8 * b);
        pos_ += static_cast<size_t>(bytes);
        return v;
    }

    const std::string& buf_;
    size_t pos_;
    size_t end_;
};

std::string frame(ModelKind kind, const std::string& payload) {
    BlobWriter w;
    std::string& out = w.buffer();
    out.append(kMagic, sizeof(kMagic));
    w.u8(static_cast<uint8_t>(kind));
    w.u16(kModelFormatVersion);
    w.u32(static_cast<uint32_t>(payload.size()));
    out.append(payload);
    w.u32(crc_of(out, out.size()));
    return std::move(out);
}

// Verifies framing and checksum; returns a reader over the payload.
BlobReader open_blob(const std::string& blob, ModelKind expected) {
    ModelKind kind = peek_model_kind(blob);
    if (kind != expected)
        throw std::runtime_error("model blob: expected kind " +
                                 std::to_string(static_cast<int>(expected)) + ", got " +
                                 std::to_string(static_cast<int>(kind)));
    return BlobReader(blob, kModelHeaderSize, blob.size() - kModelCrcSize);
}

void expect_done(const BlobReader& r) {
    if (!r.done())
        throw std::runtime_error("model blob: trailing bytes after payload");
}

}  // namespace

ModelKind peek_model_kind(const std::string& blob) {
    if (blob.size() < kModelHeaderSize + kModelCrcSize)
        throw std::runtime_error("model blob: too short (" + std::to_string(blob.size()) + " bytes)");
    if (std::memcmp(blob.data(), kMagic, sizeof(kMagic)) != 0)
        throw std::runtime_error("model blob: bad magic");

    BlobReader header(blob, sizeof(kMagic), kModelHeaderSize);
    uint8_t kind = header.u8();
    uint16_t version = header.u16();
    uint32_t payload_len = header.u32();

    if (version != kModelFormatVersion)
        throw std::runtime_error("model blob: unsupported version " + std::to_string(version));
    if (static_cast<size_t>(payload_len) + kModelHeaderSize + kModelCrcSize != blob.size())
        throw std::runtime_error("model blob: length mismatch");

    const size_t body = blob.size() - kModelCrcSize;
    BlobReader trailer(blob, body, blob.size());
    if (trailer.u32() != crc_of(blob, body))
        throw std::runtime_error("model blob: checksum mismatch");

    if (kind < static_cast<uint8_t>(ModelKind::KMeans) ||
        kind > static_cast<uint8_t>(ModelKind::Density))
        throw std::runtime_error("model blob: unknown kind " + std::to_string(kind));
    return static_cast<ModelKind>(kind);
}

std::string encode_model(const KMeansModel& model) {
    BlobWriter w;
    w.i32(model.k);
    w.u64(model.dim);
    w.u64(model.centroids.size());
    for (double v : model.centroids) w.f64(v);
    w.f64(model.inertia);
    w.i32(model.iterations);
    w.u8(model.converged ? 1 : 0);
    w.u32(model.seed);
    return frame(ModelKind::KMeans, w.buffer());
}

std::string encode_model(const MergeTree& tree) {
    BlobWriter w;
    w.u64(tree.leaf_ids.size());
    for (const auto& id : tree.leaf_ids) w.str(id);
    w.u64(tree.merges.size());
    for (const auto& m : tree.merges) {
        w.i32(m.left);
        w.i32(m.right);
        w.f64(m.height);
        w.i32(m.size);
    }
    return frame(ModelKind::MergeTree, w.buffer());
}

std::string encode_model(const DensityModel& model) {
    BlobWriter w;
    w.f64(model.eps);
    w.i32(model.min_samples);
    w.u64(model.dim);
    w.u64(model.core_points.size());
    for (double v : model.core_points) w.f64(v);
    w.u64(model.core_labels.size());
    for (int l : model.core_labels) w.i32(l);
    return frame(ModelKind::Density, w.buffer());
}

KMeansModel decode_kmeans(const std::string& blob) {
    BlobReader r = open_blob(blob, ModelKind::KMeans);
    KMeansModel m;
    m.k = r.i32();
    m.dim = static_cast<size_t>(r.u64());
    size_t n = r.count(8);
    m.centroids.resize(n);
    for (auto& v : m.centroids) v = r.f64();
    m.inertia = r.f64();
    m.iterations = r.i32();
    m.converged = r.u8() != 0;
    m.seed = r.u32();
    expect_done(r);

    if (m.k <= 0 || m.dim == 0 || m.centroids.size() != static_cast<size_t>(m.k) * m.dim)
        throw std::runtime_error("model blob: centroid block does not match k x dim");
    return m;
}

MergeTree decode_tree(const std::string& blob) {
    BlobReader r = open_blob(blob, ModelKind::MergeTree);
    MergeTree t;
    size_t n_leaves = r.count(4);
    t.leaf_ids.reserve(n_leaves);
    for (size_t i = 0; i < n_leaves; ++i) t.leaf_ids.push_back(r.str());
    size_t n_merges = r.count(20);
    t.merges.resize(n_merges);
    for (auto& m : t.merges) {
        m.left = r.i32();
        m.right = r.i32();
        m.height = r.f64();
        m.size = r.i32();
    }
    expect_done(r);

    if (n_leaves == 0 || n_merges + 1 != n_leaves)
        throw std::runtime_error("model blob: merge count does not match leaf count");
    for (size_t s = 0; s < n_merges; ++s) {
        const Merge& m = t.merges[s];
        const int created = static_cast<int>(n_leaves + s);
        if (m.left < 0 || m.right < 0 || m.left >= created || m.right >= created)
            throw std::runtime_error("model blob: merge " + std::to_string(s) +
                                     " references an unknown node");
    }
    return t;
}

DensityModel decode_density(const std::string& blob) {
    BlobReader r = open_blob(blob, ModelKind::Density);
    DensityModel m;
    m.eps = r.f64();
    m.min_samples = r.i32();
    m.dim = static_cast<size_t>(r.u64());
    size_t n_points = r.count(8);
    m.core_points.resize(n_points);
    for (auto& v : m.core_points) v = r.f64();
    size_t n_labels = r.count(4);
    m.core_labels.resize(n_labels);
    for (auto& l : m.core_labels) l = r.i32();
    expect_done(r);

    if (!(m.eps > 0.0) || m.min_samples <= 0 || m.dim == 0 ||
        m.core_points.size() != m.core_labels.size() * m.dim)
        throw std::runtime_error("model blob: invalid density model");
    return m;
}

void write_blob(const std::string& path, const std::string& blob) {
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f)
        throw std::runtime_error("write_blob: cannot open " + path + ": " + std::strerror(errno));
    size_t written = std::fwrite(blob.data(), 1, blob.size(), f);
    int rc = std::fclose(f);
    if (written != blob.size() || rc != 0)
        throw std::runtime_error("write_blob: short write to " + path);
    AC_LOG_DEBUG("model_io", "wrote %zu bytes to %s", blob.size(), path.c_str());
}

std::string read_blob(const std::string& path) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f)
        throw std::runtime_error("read_blob: cannot open " + path + ": " + std::strerror(errno));
    std::string out;
    char buf[4096];
    size_t got;
    while ((got = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, got);
    bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed)
        throw std::runtime_error("read_blob: read error on " + path);
    return out;
}

}  // namespace aidcluster
