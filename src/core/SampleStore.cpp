#include "core/SampleStore.hpp"

#include <stdexcept>
#include <utility>

std::vector<int> Sample::values() const {
    std::vector<int> out(pixels);
    if (hasLabel) {
        out.push_back(label);
    }
    return out;
}

Sample MakeSample(const Grid& grid, bool withLabel, ShapeLabel label) {
    Sample s;
    s.N = grid.N;
    s.pixels = grid.Flatten();
    s.hasLabel = withLabel;
    s.label = withLabel ? static_cast<int>(label) : 0;
    return s;
}

void SampleStore::append(Sample sample) {
    if (sample.pixels.size() != static_cast<std::size_t>(sample.N * sample.N)) {
        throw std::invalid_argument("Sample length does not match its grid size");
    }
    samples_.push_back(std::move(sample));
}

void SampleStore::clear() {
    samples_.clear();
}

