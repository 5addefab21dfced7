#pragma once

#include <cstdint>
#include <vector>

namespace sme::sparse {

// Parallel index/value arrays, indices ascending
struct SparseVector {
    std::vector<uint32_t> indices;
    std::vector<float> values;

    bool empty() const noexcept { return indices.empty(); }
    size_t size() const noexcept { return indices.size(); }

    bool operator==(const SparseVector& other) const = default;
};

} // namespace sme::sparse
