#include "mutsel/snapshot.hpp"

#include "mutsel/errors.hpp"
#include "mutsel/statistics.hpp"

#include <zlib.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace mutsel {

namespace {

template <typename T>
void append_pod(std::vector<char>& buf, const T& value) {
    const char* p = reinterpret_cast<const char*>(&value);
    buf.insert(buf.end(), p, p + sizeof(T));
}

template <typename T>
void append_array(std::vector<char>& buf, const std::vector<T>& values) {
    if (values.empty()) return;
    const char* p = reinterpret_cast<const char*>(values.data());
    buf.insert(buf.end(), p, p + values.size() * sizeof(T));
}

// Bounds-checked cursor over the decompressed payload.
class PayloadReader {
public:
    PayloadReader(const std::vector<char>& buf, const std::string& path)
        : buf_(buf), path_(path) {}

    template <typename T>
    T read() {
        T value;
        take(&value, sizeof(T));
        return value;
    }

    template <typename T>
    std::vector<T> read_array(size_t n) {
        std::vector<T> out(n);
        if (n > 0) take(out.data(), n * sizeof(T));
        return out;
    }

    bool exhausted() const { return pos_ == buf_.size(); }

private:
    void take(void* dst, size_t bytes) {
        if (bytes > buf_.size() - pos_) {
            throw InvalidArgument("Snapshot payload truncated: " + path_);
        }
        std::memcpy(dst, buf_.data() + pos_, bytes);
        pos_ += bytes;
    }

    const std::vector<char>& buf_;
    const std::string& path_;
    size_t pos_ = 0;
};

void check_shapes(const Snapshot& s) {
    if (s.class_stride == 0) throw InvalidArgument("Snapshot: class_stride must be positive");
    const size_t rows = s.trajectory.size();
    if (s.sums.size() != rows || s.log_scalars.size() != rows) {
        throw InvalidArgument("Snapshot: " + std::to_string(rows) + " trajectory rows but " +
                              std::to_string(s.sums.size()) + " sums and " +
                              std::to_string(s.log_scalars.size()) + " log-scalars");
    }
    for (const auto& row : s.trajectory) {
        if (row.size() != s.row_length()) {
            throw InvalidArgument("Snapshot: trajectory row has " + std::to_string(row.size()) +
                                  " entries, expected " + std::to_string(s.row_length()));
        }
    }
    if (s.growth.size() != s.n_classes) {
        throw InvalidArgument("Snapshot: growth has " + std::to_string(s.growth.size()) +
                              " entries, expected " + std::to_string(s.n_classes));
    }
    if (s.has_equilibrium && s.equilibrium.size() != s.n_classes) {
        throw InvalidArgument("Snapshot: equilibrium has " + std::to_string(s.equilibrium.size()) +
                              " entries, expected " + std::to_string(s.n_classes));
    }
}

// Deflate cannot expand data by more than about 1032:1.
constexpr uint64_t ZLIB_MAX_EXPANSION = 1032;

// Payload bytes implied by the header, or 0 when the shape overflows.
uint64_t expected_payload_size(const SnapshotHeader& h) {
    if (h.class_stride == 0) return 0;
    const uint64_t n = h.n_classes;
    const uint64_t row_len = (n + h.class_stride - 1) / h.class_stride;
    // trajectory row, sum and log-scalar per epoch
    const uint64_t per_epoch = (row_len + 2) * sizeof(double);
    uint64_t fixed = n * sizeof(double);
    if (h.flags & SNAPSHOT_FLAG_HAS_EQUILIBRIUM) fixed += 2 * sizeof(double) + n * sizeof(double);
    const uint64_t limit = std::numeric_limits<uint64_t>::max() - fixed;
    if (h.n_epochs > limit / per_epoch) return 0;
    return h.n_epochs * per_epoch + fixed;
}

std::vector<double> strided(const std::vector<double>& full, size_t stride) {
    std::vector<double> out;
    for (size_t i = 0; i < full.size(); i += stride) out.push_back(full[i]);
    return out;
}

}  // namespace

void write_snapshot(const std::string& path, const Snapshot& snapshot) {
    check_shapes(snapshot);

    std::vector<char> payload;
    for (const auto& row : snapshot.trajectory) append_array(payload, row);
    append_array(payload, snapshot.sums);
    append_array(payload, snapshot.log_scalars);
    append_array(payload, snapshot.growth);
    if (snapshot.has_equilibrium) {
        append_pod(payload, snapshot.eigenvalue);
        append_pod(payload, snapshot.eigen_error);
        append_array(payload, snapshot.equilibrium);
    }

    uLongf compressed_size = compressBound(static_cast<uLong>(payload.size()));
    std::vector<char> compressed(compressed_size);
    const int rc = compress2(reinterpret_cast<Bytef*>(compressed.data()), &compressed_size,
                             reinterpret_cast<const Bytef*>(payload.data()),
                             static_cast<uLong>(payload.size()), SNAPSHOT_COMPRESSION_LEVEL);
    if (rc != Z_OK) {
        throw InvalidArgument("Snapshot compression failed (zlib code " + std::to_string(rc) + ")");
    }
    compressed.resize(compressed_size);

    SnapshotHeader header;
    header.flags = (snapshot.has_equilibrium ? SNAPSHOT_FLAG_HAS_EQUILIBRIUM : 0u) |
                   (snapshot.exclude_upper_bound ? SNAPSHOT_FLAG_EXCLUDE_UPPER_BOUND : 0u);
    header.n_classes = snapshot.n_classes;
    header.class_stride = snapshot.class_stride;
    header.years_per_epoch = snapshot.years_per_epoch;
    header.numeric_kind = static_cast<uint8_t>(snapshot.kind);
    header.n_epochs = snapshot.trajectory.size();
    header.bin_width = snapshot.bin_width;
    header.death = snapshot.death;
    header.max_growth = snapshot.max_growth;
    header.payload_size = payload.size();
    header.compressed_size = compressed.size();

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw InvalidArgument("Cannot open snapshot for writing: " + path);
    out.write(reinterpret_cast<const char*>(&header), sizeof(header));
    out.write(compressed.data(), static_cast<std::streamsize>(compressed.size()));
    if (!out) throw InvalidArgument("Failed writing snapshot: " + path);
}

Snapshot read_snapshot(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw InvalidArgument("Cannot open snapshot: " + path);

    SnapshotHeader header;
    in.read(reinterpret_cast<char*>(&header), sizeof(header));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(header))) {
        throw InvalidArgument("Snapshot header truncated: " + path);
    }
    if (header.magic != SNAPSHOT_MAGIC) {
        throw InvalidArgument("Not a mutsel snapshot (bad magic): " + path);
    }
    if (header.version != SNAPSHOT_VERSION) {
        throw InvalidArgument("Unsupported snapshot version " + std::to_string(header.version) +
                              ": " + path);
    }
    if (header.numeric_kind > static_cast<uint8_t>(NumericKind::ARBITRARY)) {
        throw InvalidArgument("Snapshot has unknown numeric kind: " + path);
    }
    if (header.class_stride == 0) {
        throw InvalidArgument("Snapshot has zero class stride: " + path);
    }

    // Every size is checked against the header shape and the file length
    // before a buffer is allocated.
    const uint64_t expected = expected_payload_size(header);
    if (expected == 0 || header.payload_size != expected) {
        throw InvalidArgument("Snapshot header inconsistent with payload: " + path);
    }
    const std::streamoff body_start = in.tellg();
    in.seekg(0, std::ios::end);
    const std::streamoff body_end = in.tellg();
    in.seekg(body_start);
    if (body_start < 0 || body_end < body_start ||
        header.compressed_size > static_cast<uint64_t>(body_end - body_start)) {
        throw InvalidArgument("Snapshot payload truncated: " + path);
    }
    if (header.payload_size / ZLIB_MAX_EXPANSION > header.compressed_size) {
        throw InvalidArgument("Snapshot header inconsistent with payload: " + path);
    }

    std::vector<char> compressed(header.compressed_size);
    in.read(compressed.data(), static_cast<std::streamsize>(compressed.size()));
    if (in.gcount() != static_cast<std::streamsize>(compressed.size())) {
        throw InvalidArgument("Snapshot payload truncated: " + path);
    }

    std::vector<char> payload(header.payload_size);
    uLongf payload_size = static_cast<uLongf>(payload.size());
    const int rc = uncompress(reinterpret_cast<Bytef*>(payload.data()), &payload_size,
                              reinterpret_cast<const Bytef*>(compressed.data()),
                              static_cast<uLong>(compressed.size()));
    if (rc != Z_OK || payload_size != payload.size()) {
        throw InvalidArgument("Snapshot payload corrupt (zlib code " + std::to_string(rc) +
                              "): " + path);
    }

    Snapshot s;
    s.kind = static_cast<NumericKind>(header.numeric_kind);
    s.n_classes = header.n_classes;
    s.class_stride = header.class_stride;
    s.years_per_epoch = header.years_per_epoch;
    s.exclude_upper_bound = (header.flags & SNAPSHOT_FLAG_EXCLUDE_UPPER_BOUND) != 0;
    s.bin_width = header.bin_width;
    s.death = header.death;
    s.max_growth = header.max_growth;
    s.has_equilibrium = (header.flags & SNAPSHOT_FLAG_HAS_EQUILIBRIUM) != 0;

    PayloadReader reader(payload, path);
    const size_t rows = header.n_epochs;
    const size_t row_len = s.row_length();
    s.trajectory.reserve(rows);
    for (size_t k = 0; k < rows; ++k) s.trajectory.push_back(reader.read_array<double>(row_len));
    s.sums = reader.read_array<double>(rows);
    s.log_scalars = reader.read_array<int64_t>(rows);
    s.growth = reader.read_array<double>(s.n_classes);
    if (s.has_equilibrium) {
        s.eigenvalue = reader.read<double>();
        s.eigen_error = reader.read<double>();
        s.equilibrium = reader.read_array<double>(s.n_classes);
    }
    if (!reader.exhausted()) {
        throw InvalidArgument("Snapshot payload has trailing bytes: " + path);
    }
    return s;
}

MeanVarianceSeries snapshot_mean_and_variance(const Snapshot& snapshot) {
    const std::vector<double> g = strided(snapshot.growth, snapshot.class_stride);
    MeanVarianceSeries out;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (const auto& row : snapshot.trajectory) {
        if (row.empty() || row.size() != g.size()) {
            out.mean.push_back(nan);
            out.variance.push_back(nan);
            continue;
        }
        const double total = accurate_sum(row);
        if (!std::isfinite(total) || total == 0.0) {
            out.mean.push_back(nan);
            out.variance.push_back(nan);
            continue;
        }
        const auto mv = mean_and_variance(row, g);
        out.mean.push_back(mv.first);
        out.variance.push_back(mv.second);
    }
    return out;
}

void write_trajectory_tsv(const std::string& path, const Snapshot& snapshot) {
    check_shapes(snapshot);
    gzFile out = gzopen(path.c_str(), "wb");
    if (!out) throw InvalidArgument("Cannot open output file: " + path);

    const MeanVarianceSeries mv = snapshot_mean_and_variance(snapshot);
    const std::vector<double> g = strided(snapshot.growth, snapshot.class_stride);

    std::ostringstream oss;
    oss << std::setprecision(17);
    oss << "epoch\tyears\tlog_scalar\tsum\tmean\tvariance";
    for (double x : g) oss << "\tm=" << x;
    oss << "\n";
    for (size_t k = 0; k < snapshot.trajectory.size(); ++k) {
        const double total = snapshot.sums[k];
        oss << k << "\t" << (k * static_cast<size_t>(snapshot.years_per_epoch)) << "\t"
            << snapshot.log_scalars[k] << "\t" << total << "\t"
            << mv.mean[k] << "\t" << mv.variance[k];
        for (double x : snapshot.trajectory[k]) oss << "\t" << (x / total);
        oss << "\n";
    }

    const std::string text = oss.str();
    const int written = gzwrite(out, text.data(), static_cast<unsigned>(text.size()));
    const int rc = gzclose(out);
    if (written != static_cast<int>(text.size()) || rc != Z_OK) {
        throw InvalidArgument("Failed writing " + path);
    }
}

std::vector<std::vector<double>> read_numeric_arrays(const std::string& path) {
    // gzread passes plain files through unchanged.
    gzFile in = gzopen(path.c_str(), "rb");
    if (!in) throw InvalidArgument("Cannot open file: " + path);
    gzbuffer(in, 1024 * 1024);

    std::vector<std::vector<double>> arrays;
    std::vector<double> current;
    auto flush = [&arrays, &current]() {
        if (!current.empty()) arrays.push_back(std::move(current));
        current.clear();
    };
    auto fail = [&in, &path](const std::string& what, size_t line_no) {
        gzclose(in);
        throw InvalidArgument(what + " on line " + std::to_string(line_no) + " of " + path);
    };

    std::vector<char> chunk(1 << 16);
    std::string line;
    size_t line_no = 0;
    int depth = 0;  // open brackets, carried across lines
    bool eof = false;
    while (!eof) {
        line.clear();
        // Lines longer than one chunk arrive in pieces.
        while (true) {
            if (gzgets(in, chunk.data(), static_cast<int>(chunk.size())) == nullptr) {
                eof = true;
                break;
            }
            line += chunk.data();
            if (!line.empty() && line.back() == '\n') break;
        }
        if (line.empty()) continue;
        ++line_no;

        const char* p = line.c_str();
        while (*p != '\0') {
            const char c = *p;
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',') {
                ++p;
            } else if (c == '[') {
                flush();
                ++depth;
                ++p;
            } else if (c == ']') {
                if (depth == 0) fail("Unbalanced ']'", line_no);
                flush();
                --depth;
                ++p;
            } else {
                char* end = nullptr;
                const double v = std::strtod(p, &end);
                if (end == p) fail("Non-numeric value", line_no);
                current.push_back(v);
                p = end;
            }
        }
        // Outside brackets a line is one array.
        if (depth == 0) flush();
    }
    int errnum = Z_OK;
    gzerror(in, &errnum);
    gzclose(in);
    if (errnum != Z_OK && errnum != Z_STREAM_END) {
        throw InvalidArgument("Failed reading " + path);
    }
    if (depth != 0) throw InvalidArgument("Unclosed '[' at end of " + path);
    flush();
    return arrays;
}

}  // namespace mutsel
