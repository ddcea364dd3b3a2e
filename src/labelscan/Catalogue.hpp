#pragma once

#include "Marker.hpp"

#include <cstddef>
#include <vector>

namespace labelscan
{

// Markers found in one input, one sequence per kind in order of discovery.
// Sequences are independent of each other and keep duplicates.
struct Catalogue
{
    std::vector<Marker> tags;
    std::vector<Marker> references;
    std::vector<Marker> file_labels;
    std::vector<Marker> dir_labels;

    // Physical lines that could not be decoded and contributed no markers
    std::size_t skipped_lines = 0;

    const std::vector<Marker>& markers(MarkerKind kind) const noexcept;
    std::vector<Marker>& markers(MarkerKind kind) noexcept;

    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    // Append every sequence of other after the matching sequence of this one
    void merge(Catalogue&& other);
    void merge(const Catalogue& other);
};

} // namespace labelscan
