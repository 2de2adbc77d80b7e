#pragma once

#include "spool/mail/message_entry.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace spool::viewer
{

struct Point
{
    int x = 0;
    int y = 0;
};

struct ExportRequest
{
    std::vector<std::filesystem::path> files;
};

// Turns a press-and-drag on the message list into a file export of the entry
// that was under the pointer when the drag started.
class ExportAdapter
{
public:
    using EntryResolver = std::function<std::optional<mail::MessageEntry>(Point origin)>;
    using ExportSink = std::function<void(const ExportRequest &request)>;

    static constexpr double kDragThreshold = 10.0;

    ExportAdapter(EntryResolver resolver, ExportSink sink);

    void pointerDown(Point point);
    bool pointerMove(Point point, bool overScrollControl = false);
    void pointerUp();

    bool tracking() const noexcept { return origin_.has_value(); }

    static double distance(Point a, Point b) noexcept;

private:
    EntryResolver resolver_;
    ExportSink sink_;
    std::optional<Point> origin_;
};

} // namespace spool::viewer
