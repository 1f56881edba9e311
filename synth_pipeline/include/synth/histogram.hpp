#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace synth {

constexpr int DEFAULT_BIN_COUNT = 20;

// Equal-width histogram over [lo, hi].
//
// edges holds the left edge of each bin (edges.size() == counts.size());
// the right edge of the last bin is hi and stays implicit. Every bin is
// half-open [edge_i, edge_{i+1}) except the last, which is closed [edge, hi].
struct Histogram {
  std::vector<double> edges;
  std::vector<std::uint64_t> counts;
  double lo = 0.0;
  double hi = 0.0;
};

// Left edges of `bin_count` equal-width bins over [lo, hi].
// When lo == hi all edges collapse onto lo.
std::vector<double> equal_width_edges(double lo, double hi, int bin_count);

// Tally `values` into `bin_count` bins over [lo, hi]. Values outside the
// range are not counted. A zero-width range puts every in-range value into
// the last bin.
Histogram build_histogram(const std::vector<double>& values, double lo,
                          double hi, int bin_count);

// Tally `values` against caller-supplied full edges (n + 1 edges give n
// bins, last bin closed on the right). Fewer than two edges yield no bins.
std::vector<std::uint64_t> histogram_counts(const std::vector<double>& values,
                                            const std::vector<double>& edges);

// Largest i with edges[i] <= v, or -1 when v < edges[0].
int bisect_right_index(const std::vector<double>& edges, double v);

// counts / sum(counts). A zero total yields the uniform distribution.
std::vector<double> normalize_distribution(
    const std::vector<std::uint64_t>& counts);

}  // namespace synth
