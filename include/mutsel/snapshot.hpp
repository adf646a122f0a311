#pragma once
// Persisted runs and plain-text interchange.
//
// Snapshot file layout (little-endian):
//   SnapshotHeader (96 bytes)
//   zlib-compressed payload:
//     trajectory   n_epochs x row_len doubles (row_len = ceil(n_classes / stride))
//     sums         n_epochs doubles
//     log_scalars  n_epochs int64
//     growth       n_classes doubles
//     [eigenvalue, eigen_error, equilibrium (n_classes doubles)]  if HAS_EQUILIBRIUM

#include "mutsel/equilibrium.hpp"
#include "mutsel/evolution.hpp"
#include "mutsel/precision.hpp"
#include "mutsel/rates.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace mutsel {

constexpr uint64_t SNAPSHOT_MAGIC = 0x31304C455354554DULL;  // "MUTSEL01"
constexpr uint32_t SNAPSHOT_VERSION = 1;

constexpr uint32_t SNAPSHOT_FLAG_HAS_EQUILIBRIUM = 1u << 0;
constexpr uint32_t SNAPSHOT_FLAG_EXCLUDE_UPPER_BOUND = 1u << 1;

constexpr int SNAPSHOT_COMPRESSION_LEVEL = 6;

struct SnapshotHeader {
    uint64_t magic = SNAPSHOT_MAGIC;
    uint32_t version = SNAPSHOT_VERSION;
    uint32_t flags = 0;
    uint32_t n_classes = 0;
    uint32_t class_stride = 1;
    uint32_t years_per_epoch = 1;
    uint8_t numeric_kind = 0;
    uint8_t _pad[3] = {0, 0, 0};
    uint64_t n_epochs = 0;
    double bin_width = 0.0;
    double death = 0.0;
    double max_growth = 0.0;
    uint64_t payload_size = 0;      // uncompressed bytes
    uint64_t compressed_size = 0;
    uint8_t _reserved[16] = {};
};
static_assert(sizeof(SnapshotHeader) == 96);

struct Snapshot {
    NumericKind kind = NumericKind::FIXED;
    uint32_t n_classes = 0;
    uint32_t class_stride = 1;
    uint32_t years_per_epoch = 1;
    bool exclude_upper_bound = false;
    double bin_width = 0.0;
    double death = 0.0;
    double max_growth = 0.0;
    std::vector<double> growth;                     // all classes
    std::vector<std::vector<double>> trajectory;    // strided classes per epoch
    std::vector<double> sums;
    std::vector<int64_t> log_scalars;
    bool has_equilibrium = false;
    double eigenvalue = 0.0;
    double eigen_error = std::numeric_limits<double>::infinity();
    std::vector<double> equilibrium;

    size_t row_length() const {
        return class_stride == 0 ? 0 : (n_classes + class_stride - 1) / class_stride;
    }
};

// Throws InvalidArgument on I/O failure or inconsistent shapes.
void write_snapshot(const std::string& path, const Snapshot& snapshot);

// Throws InvalidArgument on I/O failure or a malformed file.
Snapshot read_snapshot(const std::string& path);

// Per-epoch mean and variance of growth over the recorded classes.
MeanVarianceSeries snapshot_mean_and_variance(const Snapshot& snapshot);

// gzip TSV: epoch, years, log_scalar, sum, mean, variance, then the
// normalized frequency of every recorded class.
void write_trajectory_tsv(const std::string& path, const Snapshot& snapshot);

// Numeric arrays from a text file (gzip-compressed or plain). Whitespace and
// commas separate values. Inside JSON-style brackets every innermost bracket
// pair is one array, across lines (`[[1, 2], [3]]` gives two arrays); outside
// brackets every non-empty line is one array. Unbalanced brackets and
// non-numeric tokens throw InvalidArgument.
std::vector<std::vector<double>> read_numeric_arrays(const std::string& path);

template <typename Real>
Snapshot make_snapshot(const Evolution<Real>& evolution, const Rates<Real>& rates,
                       const EigenPair<Real>* equilibrium = nullptr) {
    Snapshot s;
    s.kind = numeric_kind_of<Real>();
    s.n_classes = static_cast<uint32_t>(rates.n_classes);
    s.class_stride = static_cast<uint32_t>(evolution.params().class_stride);
    s.years_per_epoch = evolution.params().years_per_epoch;
    s.exclude_upper_bound = rates.exclude_upper_bound;
    s.bin_width = to_double(rates.delta);
    s.death = to_double(rates.death);
    s.max_growth = to_double(rates.max_growth);
    s.growth = convert_vector<double>(rates.growth);
    s.trajectory = evolution.trajectory();
    s.sums = evolution.sums();
    s.log_scalars.assign(evolution.log_scalars().begin(), evolution.log_scalars().end());
    if (equilibrium != nullptr) {
        s.has_equilibrium = true;
        s.eigenvalue = to_double(equilibrium->value);
        s.eigen_error = equilibrium->error;
        s.equilibrium = convert_vector<double>(equilibrium->vector);
    }
    return s;
}

}  // namespace mutsel
