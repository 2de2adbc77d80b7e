#include <gtest/gtest.h>

#include "fakes.hpp"
#include "spool/viewer/export_adapter.hpp"

#include <vector>

using spool::testing::makeEntry;
using spool::viewer::ExportAdapter;
using spool::viewer::ExportRequest;
using spool::viewer::Point;

namespace
{

struct Recorder
{
    std::vector<ExportRequest> exports;
    std::vector<Point> resolved;
    std::string file = "/spool/incoming/a.eml";

    ExportAdapter make()
    {
        return ExportAdapter(
            [this](Point origin) -> std::optional<spool::mail::MessageEntry> {
                resolved.push_back(origin);
                return makeEntry("a.eml", 1, file);
            },
            [this](const ExportRequest &request) { exports.push_back(request); });
    }
};

} // namespace

TEST(ExportAdapter, MoveBelowThresholdNeverExports)
{
    Recorder recorder;
    auto adapter = recorder.make();
    adapter.pointerDown({0, 0});
    EXPECT_FALSE(adapter.pointerMove({6, 7}));
    EXPECT_FALSE(adapter.pointerMove({9, 0}));
    adapter.pointerUp();
    EXPECT_TRUE(recorder.exports.empty());
    EXPECT_TRUE(recorder.resolved.empty());
}

TEST(ExportAdapter, MoveAtThresholdExportsOnceWithOriginEntry)
{
    Recorder recorder;
    auto adapter = recorder.make();
    adapter.pointerDown({2, 3});
    EXPECT_TRUE(adapter.pointerMove({8, 11}));
    EXPECT_FALSE(adapter.tracking());
    EXPECT_FALSE(adapter.pointerMove({30, 30}));

    ASSERT_EQ(recorder.exports.size(), 1u);
    ASSERT_EQ(recorder.exports.front().files.size(), 1u);
    EXPECT_EQ(recorder.exports.front().files.front(), "/spool/incoming/a.eml");
    ASSERT_EQ(recorder.resolved.size(), 1u);
    EXPECT_EQ(recorder.resolved.front().x, 2);
    EXPECT_EQ(recorder.resolved.front().y, 3);
}

TEST(ExportAdapter, ScrollControlMovesAreIgnored)
{
    Recorder recorder;
    auto adapter = recorder.make();
    adapter.pointerDown({0, 0});
    EXPECT_FALSE(adapter.pointerMove({50, 0}, true));
    EXPECT_TRUE(adapter.tracking());
    EXPECT_TRUE(recorder.exports.empty());
}

TEST(ExportAdapter, EntryWithoutFileIsSkipped)
{
    Recorder recorder;
    recorder.file.clear();
    auto adapter = recorder.make();
    adapter.pointerDown({0, 0});
    EXPECT_FALSE(adapter.pointerMove({20, 0}));
    EXPECT_TRUE(recorder.exports.empty());
    EXPECT_FALSE(adapter.tracking());
}

TEST(ExportAdapter, PointerUpResetsOrigin)
{
    Recorder recorder;
    auto adapter = recorder.make();
    adapter.pointerDown({0, 0});
    adapter.pointerUp();
    EXPECT_FALSE(adapter.pointerMove({40, 40}));
    EXPECT_TRUE(recorder.exports.empty());
}

TEST(ExportAdapter, MoveWithoutPressIsIgnored)
{
    Recorder recorder;
    auto adapter = recorder.make();
    EXPECT_FALSE(adapter.pointerMove({40, 40}));
    EXPECT_TRUE(recorder.resolved.empty());
}

TEST(ExportAdapter, DistanceIsEuclidean)
{
    EXPECT_DOUBLE_EQ(ExportAdapter::distance({0, 0}, {3, 4}), 5.0);
    EXPECT_DOUBLE_EQ(ExportAdapter::distance({5, 5}, {5, 5}), 0.0);
}
