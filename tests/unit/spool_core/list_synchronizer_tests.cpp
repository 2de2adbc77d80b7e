#include <gtest/gtest.h>

#include "fakes.hpp"
#include "spool/viewer/list_synchronizer.hpp"

#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using spool::testing::makeEntry;
using spool::viewer::ListSynchronizer;

namespace
{

std::vector<std::string> tokens(const ListSynchronizer &list)
{
    std::vector<std::string> result;
    for (const auto &entry : list.entries())
        result.push_back(entry.token());
    return result;
}

std::string selectedToken(const ListSynchronizer &list)
{
    auto entry = list.selectedEntry();
    return entry ? entry->token() : std::string();
}

} // namespace

TEST(ListSynchronizer, ResetInsertRemoveScenario)
{
    ListSynchronizer list;
    list.reset({makeEntry("M1", 1), makeEntry("M2", 2)});
    EXPECT_EQ(tokens(list), (std::vector<std::string>{"M1", "M2"}));
    EXPECT_EQ(selectedToken(list), "M2");

    EXPECT_TRUE(list.insert(makeEntry("M3", 3)));
    EXPECT_EQ(tokens(list), (std::vector<std::string>{"M1", "M2", "M3"}));
    EXPECT_EQ(selectedToken(list), "M2");

    EXPECT_EQ(list.remove({makeEntry("M2", 2)}), 1u);
    EXPECT_EQ(tokens(list), (std::vector<std::string>{"M1", "M3"}));
    EXPECT_EQ(selectedToken(list), "M3");
}

TEST(ListSynchronizer, ResetSortsAndDropsDuplicates)
{
    ListSynchronizer list;
    list.reset({makeEntry("c", 30), makeEntry("a", 10), makeEntry("b", 20), makeEntry("a", 40)});
    EXPECT_EQ(tokens(list), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(ListSynchronizer, ResetKeepsOrdinalIndexWhenStillInRange)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 1), makeEntry("b", 2), makeEntry("c", 3)});
    list.select(0);

    list.reset({makeEntry("x", 1), makeEntry("y", 2)});
    ASSERT_TRUE(list.selectedIndex());
    EXPECT_EQ(*list.selectedIndex(), 0u);
    EXPECT_EQ(selectedToken(list), "x");

    list.select(1);
    list.reset({makeEntry("z", 5)});
    EXPECT_EQ(selectedToken(list), "z");

    list.reset({});
    EXPECT_FALSE(list.selectedIndex());
}

TEST(ListSynchronizer, InsertKeepsSelectedEntryAndShiftsIndex)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 10), makeEntry("c", 30)});
    list.select(1);

    EXPECT_TRUE(list.insert(makeEntry("b", 20)));
    EXPECT_EQ(tokens(list), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(selectedToken(list), "c");
    EXPECT_EQ(*list.selectedIndex(), 2u);
}

TEST(ListSynchronizer, InsertPlacesEqualTimestampsAfterExisting)
{
    ListSynchronizer list;
    list.reset({makeEntry("first", 10)});
    list.insert(makeEntry("second", 10));
    EXPECT_EQ(tokens(list), (std::vector<std::string>{"first", "second"}));
}

TEST(ListSynchronizer, InsertIgnoresDuplicateToken)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 10)});
    EXPECT_FALSE(list.insert(makeEntry("a", 50)));
    EXPECT_EQ(list.size(), 1u);
}

TEST(ListSynchronizer, RemovingSelectedFallsBackToLastThenNothing)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 1), makeEntry("b", 2), makeEntry("c", 3)});
    list.select(2);

    list.remove({makeEntry("c", 3)});
    EXPECT_EQ(selectedToken(list), "b");

    list.remove({makeEntry("a", 1), makeEntry("b", 2)});
    EXPECT_TRUE(list.empty());
    EXPECT_FALSE(list.selectedIndex());
}

TEST(ListSynchronizer, RemovingOtherEntryKeepsSelection)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 1), makeEntry("b", 2), makeEntry("c", 3)});
    list.select(2);

    list.remove({makeEntry("a", 1)});
    EXPECT_EQ(selectedToken(list), "c");
    EXPECT_EQ(*list.selectedIndex(), 1u);
}

TEST(ListSynchronizer, RemoveUsesCapturedPriorIndex)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 1), makeEntry("b", 2), makeEntry("c", 3), makeEntry("d", 4)});
    list.select(1);

    list.remove({makeEntry("b", 2)}, std::size_t{0});
    EXPECT_EQ(selectedToken(list), "a");
}

TEST(ListSynchronizer, CallbackFiresOnlyWhenSelectedEntryChanges)
{
    ListSynchronizer list;
    std::vector<std::string> seen;
    list.setSelectionChangedCallback([&seen](const std::optional<spool::mail::MessageEntry> &entry) {
        seen.push_back(entry ? entry->token() : std::string("<none>"));
    });

    list.reset({makeEntry("a", 1), makeEntry("b", 2)});
    list.insert(makeEntry("c", 3));
    list.select(1);
    list.select(0);
    list.select(std::nullopt);

    EXPECT_EQ(seen, (std::vector<std::string>{"b", "a", "<none>"}));
}

TEST(ListSynchronizer, SelectOutOfRangeThrows)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 1)});
    EXPECT_THROW(list.select(3), std::out_of_range);
    EXPECT_EQ(selectedToken(list), "a");
}

TEST(ListSynchronizer, MarksFormMultiSelectionInListOrder)
{
    ListSynchronizer list;
    list.reset({makeEntry("a", 1), makeEntry("b", 2), makeEntry("c", 3)});
    list.select(1);
    EXPECT_TRUE(list.toggleMark(2));
    EXPECT_TRUE(list.toggleMark(0));
    EXPECT_FALSE(list.toggleMark(7));

    std::vector<std::string> selected;
    for (const auto &entry : list.selectedEntries())
        selected.push_back(entry.token());
    EXPECT_EQ(selected, (std::vector<std::string>{"a", "b", "c"}));

    EXPECT_FALSE(list.toggleMark(0));
    EXPECT_FALSE(list.isMarked(0));
    EXPECT_TRUE(list.isMarked(2));

    list.reset({makeEntry("b", 2)});
    EXPECT_FALSE(list.isMarked(0));
}

TEST(ListSynchronizer, RandomOperationsKeepListSortedAndUnique)
{
    ListSynchronizer list;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> tokenDist(0, 40);
    std::uniform_int_distribution<int> timeDist(0, 20);
    std::uniform_int_distribution<int> opDist(0, 2);

    for (int step = 0; step < 500; ++step)
    {
        const int id = tokenDist(rng);
        const auto entry = makeEntry("m" + std::to_string(id), timeDist(rng));
        switch (opDist(rng))
        {
        case 0:
            list.insert(entry);
            break;
        case 1:
            list.remove({entry});
            break;
        default:
            if (!list.empty())
                list.select(static_cast<std::size_t>(id) % list.size());
            break;
        }

        std::set<std::string> unique;
        for (std::size_t i = 0; i < list.size(); ++i)
        {
            ASSERT_TRUE(unique.insert(list.entries()[i].token()).second);
            if (i > 0)
                ASSERT_LE(list.entries()[i - 1].modified(), list.entries()[i].modified());
        }
        if (list.selectedIndex())
            ASSERT_LT(*list.selectedIndex(), list.size());
    }
}
