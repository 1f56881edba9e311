// histogram.cpp
//
// Equal-width binning used by non-categorical attributes, plus the shared
// count -> probability normalization.

#include "synth/histogram.hpp"

#include <algorithm>
#include <numeric>
#include <ranges>
#include <stdexcept>

namespace rng = std::ranges;
namespace vw  = std::views;

namespace synth {

std::vector<double> equal_width_edges(double lo, double hi, int bin_count) {
  if (bin_count <= 0) {
    throw std::invalid_argument("equal_width_edges: bin_count must be > 0");
  }
  if (hi < lo) {
    throw std::invalid_argument("equal_width_edges: hi < lo");
  }

  std::vector<double> edges(static_cast<std::size_t>(bin_count));
  const double width = (hi - lo) / static_cast<double>(bin_count);
  rng::for_each(vw::iota(0, bin_count), [&](int i) {
    edges[static_cast<std::size_t>(i)] = lo + width * static_cast<double>(i);
  });
  return edges;
}

Histogram build_histogram(const std::vector<double>& values, double lo,
                          double hi, int bin_count) {
  Histogram h;
  h.lo = lo;
  h.hi = hi;
  h.edges = equal_width_edges(lo, hi, bin_count);
  h.counts.assign(h.edges.size(), 0);

  const int last = bin_count - 1;
  for (double v : values) {
    if (v < lo || v > hi) continue;
    int idx = bisect_right_index(h.edges, v);
    // Right-closed last bin; also guards against edge rounding near hi.
    if (v == hi || idx > last) idx = last;
    if (idx < 0) idx = 0;
    ++h.counts[static_cast<std::size_t>(idx)];
  }
  return h;
}

std::vector<std::uint64_t> histogram_counts(const std::vector<double>& values,
                                            const std::vector<double>& edges) {
  if (edges.size() < 2) return {};
  if (!std::is_sorted(edges.begin(), edges.end())) {
    throw std::invalid_argument("histogram_counts: edges must be ascending");
  }

  const std::size_t n_bins = edges.size() - 1;
  std::vector<std::uint64_t> counts(n_bins, 0);
  const double lo = edges.front();
  const double hi = edges.back();
  for (double v : values) {
    if (v < lo || v > hi) continue;
    if (v == hi) {
      ++counts[n_bins - 1];
      continue;
    }
    const int idx = bisect_right_index(edges, v);
    ++counts[static_cast<std::size_t>(std::min<int>(idx, static_cast<int>(n_bins) - 1))];
  }
  return counts;
}

int bisect_right_index(const std::vector<double>& edges, double v) {
  const auto it = std::upper_bound(edges.begin(), edges.end(), v);
  return static_cast<int>(std::distance(edges.begin(), it)) - 1;
}

std::vector<double> normalize_distribution(
    const std::vector<std::uint64_t>& counts) {
  std::vector<double> prs(counts.size(), 0.0);
  if (counts.empty()) return prs;

  const std::uint64_t total =
      std::accumulate(counts.begin(), counts.end(), std::uint64_t{0});
  if (total == 0) {
    std::fill(prs.begin(), prs.end(), 1.0 / static_cast<double>(counts.size()));
    return prs;
  }

  for (std::size_t i = 0; i < counts.size(); ++i) {
    prs[i] = static_cast<double>(counts[i]) / static_cast<double>(total);
  }
  return prs;
}

}  // namespace synth
