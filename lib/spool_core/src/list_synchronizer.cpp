#include "spool/viewer/list_synchronizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace spool::viewer
{

using mail::MessageEntry;

namespace
{
bool earlier(const MessageEntry &lhs, const MessageEntry &rhs)
{
    return lhs.modified() < rhs.modified();
}
} // namespace

void ListSynchronizer::reset(std::vector<MessageEntry> entries)
{
    const auto previousToken = selectedToken();
    const auto previousIndex = entries_.empty() ? std::nullopt : selected_;

    std::stable_sort(entries.begin(), entries.end(), earlier);
    std::unordered_set<std::string> seen;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&seen](const MessageEntry &entry) { return !seen.insert(entry.token()).second; }),
                  entries.end());
    entries_ = std::move(entries);

    for (auto it = marked_.begin(); it != marked_.end();)
    {
        if (seen.count(*it) == 0)
            it = marked_.erase(it);
        else
            ++it;
    }

    if (previousIndex && *previousIndex < entries_.size())
        selected_ = previousIndex;
    else if (!entries_.empty())
        selected_ = entries_.size() - 1;
    else
        selected_.reset();

    publishIfChanged(previousToken);
}

bool ListSynchronizer::insert(const MessageEntry &entry)
{
    if (indexOf(entry.token()))
        return false;

    const auto previousToken = selectedToken();
    const std::size_t position = insertPosition(entry);
    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(position), entry);
    if (selected_ && *selected_ >= position)
        ++*selected_;

    publishIfChanged(previousToken);
    return true;
}

std::size_t ListSynchronizer::remove(const std::vector<MessageEntry> &entries)
{
    return remove(entries, selected_);
}

std::size_t ListSynchronizer::remove(const std::vector<MessageEntry> &entries,
                                     std::optional<std::size_t> priorIndex)
{
    const auto previousToken = selectedToken();

    std::unordered_set<std::string> doomed;
    for (const auto &entry : entries)
        doomed.insert(entry.token());

    const std::size_t before = entries_.size();
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&doomed](const MessageEntry &entry) { return doomed.count(entry.token()) != 0; }),
                   entries_.end());
    for (const auto &token : doomed)
        marked_.erase(token);
    const std::size_t removed = before - entries_.size();

    std::optional<std::size_t> survivor = previousToken ? indexOf(*previousToken) : std::nullopt;
    if (survivor)
        selected_ = survivor;
    else
        applyRemovalRule(priorIndex);

    publishIfChanged(previousToken);
    return removed;
}

void ListSynchronizer::select(std::optional<std::size_t> index)
{
    if (index && *index >= entries_.size())
        throw std::out_of_range("selection index " + std::to_string(*index) + " outside list of " +
                                std::to_string(entries_.size()));

    const auto previousToken = selectedToken();
    selected_ = index;
    publishIfChanged(previousToken);
}

void ListSynchronizer::selectLast()
{
    if (entries_.empty())
        select(std::nullopt);
    else
        select(entries_.size() - 1);
}

bool ListSynchronizer::toggleMark(std::size_t index)
{
    if (index >= entries_.size())
        return false;
    const std::string &token = entries_[index].token();
    if (marked_.erase(token) != 0)
        return false;
    marked_.insert(token);
    return true;
}

void ListSynchronizer::clearMarks()
{
    marked_.clear();
}

std::optional<MessageEntry> ListSynchronizer::selectedEntry() const
{
    if (!selected_)
        return std::nullopt;
    return entries_[*selected_];
}

bool ListSynchronizer::isMarked(std::size_t index) const
{
    return index < entries_.size() && marked_.count(entries_[index].token()) != 0;
}

std::vector<MessageEntry> ListSynchronizer::selectedEntries() const
{
    std::vector<MessageEntry> result;
    for (std::size_t i = 0; i < entries_.size(); ++i)
    {
        if ((selected_ && *selected_ == i) || marked_.count(entries_[i].token()) != 0)
            result.push_back(entries_[i]);
    }
    return result;
}

std::optional<std::size_t> ListSynchronizer::indexOf(const std::string &token) const
{
    for (std::size_t i = 0; i < entries_.size(); ++i)
    {
        if (entries_[i].token() == token)
            return i;
    }
    return std::nullopt;
}

std::size_t ListSynchronizer::insertPosition(const MessageEntry &entry) const
{
    auto it = std::upper_bound(entries_.begin(), entries_.end(), entry, earlier);
    return static_cast<std::size_t>(it - entries_.begin());
}

void ListSynchronizer::applyRemovalRule(std::optional<std::size_t> priorIndex)
{
    if (priorIndex && *priorIndex < entries_.size())
        selected_ = priorIndex;
    else if (!entries_.empty())
        selected_ = entries_.size() - 1;
    else
        selected_.reset();
}

void ListSynchronizer::publishIfChanged(const std::optional<std::string> &previousToken)
{
    if (selectedToken() == previousToken)
        return;
    if (selectionChanged_)
        selectionChanged_(selectedEntry());
}

std::optional<std::string> ListSynchronizer::selectedToken() const
{
    if (!selected_)
        return std::nullopt;
    return entries_[*selected_].token();
}

} // namespace spool::viewer
