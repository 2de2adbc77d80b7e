#pragma once

#include <cstdint>

namespace spool::commands::view
{

// Turbo Vision can only disable commands below 256.
inline constexpr std::uint16_t DeleteSelected = 120;
inline constexpr std::uint16_t OpenHtml = 121;
inline constexpr std::uint16_t CopyPath = 122;

inline constexpr std::uint16_t Refresh = 1000;
inline constexpr std::uint16_t ToggleMark = 1002;
inline constexpr std::uint16_t ShowMostRecent = 1003;
inline constexpr std::uint16_t ReloadMessage = 1004;
inline constexpr std::uint16_t ToggleNotifications = 1006;
inline constexpr std::uint16_t About = 1007;

inline constexpr std::uint16_t TabNext = 2700;
inline constexpr std::uint16_t TabPrevious = 2701;
inline constexpr std::uint16_t ShowMessageTab = 2710;
inline constexpr std::uint16_t ShowHeadersTab = 2711;
inline constexpr std::uint16_t ShowBodyTab = 2712;
inline constexpr std::uint16_t ShowTextTab = 2713;

} // namespace spool::commands::view
