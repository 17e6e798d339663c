#pragma once
#include <string>

namespace spotycli {

// Opens the authorization URL in the user's browser. Failures are reported by
// exception so the caller can fall back to printing the URL.
class OAuth2Browser {
public:
    // Throws std::runtime_error when no browser could be started
    static void OpenUrl(const std::string& url);

    // Launcher command: $BROWSER when set, otherwise the platform opener
    static std::string LauncherCommand();

    // False on a Linux console or SSH session without X11/Wayland and without $BROWSER
    static bool HasGraphicalSession();

private:
    static void OpenUrlWindows(const std::string& url);
    static void OpenUrlMacOS(const std::string& url);
    static void OpenUrlPosix(const std::string& launcher, const std::string& url);
};

} // namespace spotycli
