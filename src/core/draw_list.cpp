#include <algorithm>
#include <plotcore/context.hpp>

namespace plotcore
{

void DrawList::push_segment(const Vec2& a, const Vec2& b, const DrawStyle& style)
{
    items_.push_back(Drawable{Drawable::Kind::Segment, a, b, style});
}

void DrawList::push_marker(const Vec2& p, const DrawStyle& style)
{
    items_.push_back(Drawable{Drawable::Kind::Marker, p, p, style});
}

size_t DrawList::segment_count() const
{
    return static_cast<size_t>(std::count_if(items_.begin(),
                                             items_.end(),
                                             [](const Drawable& d)
                                             { return d.kind == Drawable::Kind::Segment; }));
}

size_t DrawList::marker_count() const
{
    return items_.size() - segment_count();
}

}   // namespace plotcore
