#include "oauth2_browser.hpp"
#include "spotycli_tracing.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#elif defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <ApplicationServices/ApplicationServices.h>
#endif

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#endif

namespace spotycli {

namespace {

bool EnvSet(const char* name) {
    const char* value = std::getenv(name);
    return value && *value;
}

} // namespace

void OAuth2Browser::OpenUrl(const std::string& url) {
    if (!HasGraphicalSession()) {
        throw std::runtime_error("No graphical session to open a browser in");
    }

    auto launcher = LauncherCommand();
    SPOTYCLI_TRACE_DEBUG("OAUTH2_BROWSER", "Opening authorization URL with " + launcher);

#ifdef _WIN32
    if (!EnvSet("BROWSER")) {
        OpenUrlWindows(url);
        return;
    }
    throw std::runtime_error("$BROWSER is not supported on Windows");
#else
#ifdef __APPLE__
    if (!EnvSet("BROWSER")) {
        OpenUrlMacOS(url);
        return;
    }
#endif
    OpenUrlPosix(launcher, url);
#endif
}

std::string OAuth2Browser::LauncherCommand() {
    if (EnvSet("BROWSER")) {
        return std::getenv("BROWSER");
    }
#ifdef _WIN32
    return "ShellExecute";
#elif defined(__APPLE__)
    return "LaunchServices";
#else
    return "xdg-open";
#endif
}

bool OAuth2Browser::HasGraphicalSession() {
#if defined(_WIN32) || defined(__APPLE__)
    return true;
#else
    return EnvSet("BROWSER") || EnvSet("DISPLAY") || EnvSet("WAYLAND_DISPLAY");
#endif
}

void OAuth2Browser::OpenUrlWindows(const std::string& url) {
#ifdef _WIN32
    HINSTANCE result = ShellExecuteA(NULL, "open", url.c_str(), NULL, NULL, SW_SHOWNORMAL);
    if (reinterpret_cast<INT_PTR>(result) <= 32) {
        throw std::runtime_error("ShellExecute could not open the browser");
    }
#else
    (void)url;
#endif
}

void OAuth2Browser::OpenUrlMacOS(const std::string& url) {
#ifdef __APPLE__
    CFURLRef url_ref = CFURLCreateWithBytes(NULL, reinterpret_cast<const UInt8*>(url.data()),
                                            static_cast<CFIndex>(url.size()), kCFStringEncodingUTF8, NULL);
    if (!url_ref) {
        throw std::runtime_error("Invalid URL for browser: " + url);
    }

    OSStatus status = LSOpenCFURLRef(url_ref, NULL);
    CFRelease(url_ref);
    if (status != noErr) {
        throw std::runtime_error("LaunchServices could not open the browser (status " + std::to_string(status) + ")");
    }
#else
    (void)url;
#endif
}

void OAuth2Browser::OpenUrlPosix(const std::string& launcher, const std::string& url) {
#ifndef _WIN32
    // Close-on-exec pipe: a successful exec closes it, a failed one writes errno
    int exec_pipe[2];
    if (pipe(exec_pipe) != 0) {
        throw std::runtime_error("Failed to create pipe for browser launcher: " + std::string(std::strerror(errno)));
    }
    if (fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        throw std::runtime_error("Failed to prepare pipe for browser launcher");
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        throw std::runtime_error("Failed to fork browser launcher");
    }

    if (pid == 0) {
        // Double fork: the launcher is reparented and never left as our zombie
        close(exec_pipe[0]);
        pid_t launcher_pid = fork();
        if (launcher_pid < 0) {
            int err = errno;
            ssize_t written = write(exec_pipe[1], &err, sizeof(err));
            _exit(written == static_cast<ssize_t>(sizeof(err)) ? 1 : 126);
        }
        if (launcher_pid > 0) {
            _exit(0);
        }

        setsid();
        // Keep the launcher's output off the terminal UI
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        execlp(launcher.c_str(), launcher.c_str(), url.c_str(), static_cast<char*>(nullptr));
        int err = errno;
        ssize_t written = write(exec_pipe[1], &err, sizeof(err));
        _exit(written == static_cast<ssize_t>(sizeof(err)) ? 127 : 126);
    }

    close(exec_pipe[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n > 0) {
        throw std::runtime_error("Browser launcher '" + launcher + "' not found: " + std::strerror(exec_errno));
    }
#else
    (void)launcher;
    (void)url;
#endif
}

} // namespace spotycli
