#include "Catalogue.hpp"

#include <iterator>

namespace labelscan
{

namespace
{

void appendMoved(std::vector<Marker>& dst, std::vector<Marker>& src)
{
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
    src.clear();
}

} // anonymous namespace

const std::vector<Marker>& Catalogue::markers(MarkerKind kind) const noexcept
{
    switch (kind)
    {
    case MarkerKind::Reference:
        return references;
    case MarkerKind::FileLabel:
        return file_labels;
    case MarkerKind::DirLabel:
        return dir_labels;
    case MarkerKind::Tag:
    default:
        return tags;
    }
}

std::vector<Marker>& Catalogue::markers(MarkerKind kind) noexcept
{
    switch (kind)
    {
    case MarkerKind::Reference:
        return references;
    case MarkerKind::FileLabel:
        return file_labels;
    case MarkerKind::DirLabel:
        return dir_labels;
    case MarkerKind::Tag:
    default:
        return tags;
    }
}

std::size_t Catalogue::size() const noexcept
{
    return tags.size() + references.size() + file_labels.size() + dir_labels.size();
}

void Catalogue::merge(Catalogue&& other)
{
    appendMoved(tags, other.tags);
    appendMoved(references, other.references);
    appendMoved(file_labels, other.file_labels);
    appendMoved(dir_labels, other.dir_labels);
    skipped_lines += other.skipped_lines;
    other.skipped_lines = 0;
}

void Catalogue::merge(const Catalogue& other)
{
    tags.insert(tags.end(), other.tags.begin(), other.tags.end());
    references.insert(references.end(), other.references.begin(), other.references.end());
    file_labels.insert(file_labels.end(), other.file_labels.begin(), other.file_labels.end());
    dir_labels.insert(dir_labels.end(), other.dir_labels.begin(), other.dir_labels.end());
    skipped_lines += other.skipped_lines;
}

} // namespace labelscan
