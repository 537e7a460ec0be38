#pragma once

#include <cstddef>
#include <vector>

#include "core/Grid.hpp"

enum class ShapeLabel { CIRCLE = 0, CROSS = 1 };

struct Sample {
    int N{0};
    std::vector<int> pixels; // linearized grid, idx = r * N + c
    bool hasLabel{false};
    int label{0};           // 0 = circle, 1 = cross

    /// Flattened row as written to disk: pixels followed by the label, if any.
    std::vector<int> values() const;
};

/// Flattens the grid row-major and appends the label when one is given.
Sample MakeSample(const Grid& grid, bool withLabel, ShapeLabel label);

/**
 * Append-only, insertion-ordered collection of finalized samples.
 */
class SampleStore {
public:
    void append(Sample sample);
    void clear();
    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    const std::vector<Sample>& samples() const { return samples_; }

private:
    std::vector<Sample> samples_;
};
