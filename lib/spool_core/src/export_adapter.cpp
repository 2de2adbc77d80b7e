#include "spool/viewer/export_adapter.hpp"

#include <cmath>

namespace spool::viewer
{

ExportAdapter::ExportAdapter(EntryResolver resolver, ExportSink sink)
    : resolver_(std::move(resolver)), sink_(std::move(sink))
{
}

void ExportAdapter::pointerDown(Point point)
{
    origin_ = point;
}

bool ExportAdapter::pointerMove(Point point, bool overScrollControl)
{
    if (!origin_ || overScrollControl)
        return false;
    if (distance(*origin_, point) < kDragThreshold)
        return false;

    const Point origin = *origin_;
    origin_.reset();

    if (!resolver_)
        return false;
    std::optional<mail::MessageEntry> entry = resolver_(origin);
    if (!entry || !entry->hasFile())
        return false;

    if (sink_)
        sink_(ExportRequest{{entry->file()}});
    return true;
}

void ExportAdapter::pointerUp()
{
    origin_.reset();
}

double ExportAdapter::distance(Point a, Point b) noexcept
{
    const double dx = static_cast<double>(b.x - a.x);
    const double dy = static_cast<double>(b.y - a.y);
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace spool::viewer
