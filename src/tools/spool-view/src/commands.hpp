#pragma once

#include "spool/commands/spool_view.hpp"

inline constexpr unsigned short cmRefresh = spool::commands::view::Refresh;
inline constexpr unsigned short cmDeleteSelected = spool::commands::view::DeleteSelected;
inline constexpr unsigned short cmToggleMark = spool::commands::view::ToggleMark;
inline constexpr unsigned short cmShowMostRecent = spool::commands::view::ShowMostRecent;
inline constexpr unsigned short cmReloadMessage = spool::commands::view::ReloadMessage;
inline constexpr unsigned short cmOpenHtml = spool::commands::view::OpenHtml;
inline constexpr unsigned short cmCopyPath = spool::commands::view::CopyPath;
inline constexpr unsigned short cmToggleNotifications = spool::commands::view::ToggleNotifications;
inline constexpr unsigned short cmAbout = spool::commands::view::About;
inline constexpr unsigned short cmShowMessageTab = spool::commands::view::ShowMessageTab;
inline constexpr unsigned short cmShowHeadersTab = spool::commands::view::ShowHeadersTab;
inline constexpr unsigned short cmShowBodyTab = spool::commands::view::ShowBodyTab;
inline constexpr unsigned short cmShowTextTab = spool::commands::view::ShowTextTab;
