#ifndef PLATFORM_H
#define PLATFORM_H

#include <QtGlobal>

enum class Platform
{
    Desktop,
    Mobile
};

// Resolved once at build time; the bootstrapper branches on it with if constexpr.
#if defined(TIMESHEET_MOBILE) || defined(Q_OS_ANDROID) || defined(Q_OS_IOS)
constexpr Platform kPlatform = Platform::Mobile;
#else
constexpr Platform kPlatform = Platform::Desktop;
#endif

constexpr bool isDesktop(Platform platform)
{
    return platform == Platform::Desktop;
}

#endif // PLATFORM_H
