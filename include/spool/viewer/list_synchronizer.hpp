#pragma once

#include "spool/mail/message_entry.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace spool::viewer
{

/**
 * @brief Owns the visible message list and its selection.
 *
 * Entries are kept sorted by modification time (oldest first) with unique
 * tokens. The primary selection is either empty or a valid index. Additional
 * entries can be marked to form a multi-selection. Confined to the UI queue.
 */
class ListSynchronizer
{
public:
    using SelectionChangedCallback =
        std::function<void(const std::optional<mail::MessageEntry> &selected)>;

    void setSelectionChangedCallback(SelectionChangedCallback callback)
    {
        selectionChanged_ = std::move(callback);
    }

    void reset(std::vector<mail::MessageEntry> entries);
    bool insert(const mail::MessageEntry &entry);
    std::size_t remove(const std::vector<mail::MessageEntry> &entries);
    std::size_t remove(const std::vector<mail::MessageEntry> &entries,
                       std::optional<std::size_t> priorIndex);

    void select(std::optional<std::size_t> index);
    void selectLast();
    bool toggleMark(std::size_t index);
    void clearMarks();

    const std::vector<mail::MessageEntry> &entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    std::optional<std::size_t> selectedIndex() const noexcept { return selected_; }
    std::optional<mail::MessageEntry> selectedEntry() const;
    bool isMarked(std::size_t index) const;
    std::vector<mail::MessageEntry> selectedEntries() const;
    std::optional<std::size_t> indexOf(const std::string &token) const;

private:
    std::size_t insertPosition(const mail::MessageEntry &entry) const;
    void applyRemovalRule(std::optional<std::size_t> priorIndex);
    void publishIfChanged(const std::optional<std::string> &previousToken);
    std::optional<std::string> selectedToken() const;

    std::vector<mail::MessageEntry> entries_;
    std::optional<std::size_t> selected_;
    std::set<std::string> marked_;
    SelectionChangedCallback selectionChanged_;
};

} // namespace spool::viewer
