//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrowserLauncher.hpp
// Purpose: Opens the system browser on a vetted URI via the native opener and shell-free fallbacks
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace deskauth {

// Seam the flow orchestrator depends on. Open() throws errors::AuthError (Security or Launch).
class IBrowserLauncher {
public:
    virtual ~IBrowserLauncher() = default;
    virtual void Open(const std::string& uri) = 0;
};

//==========================================================================================================
// INativeUrlOpener
// Purpose: Platform URL handler (ShellExecuteW on Windows, LSOpenCFURLRef on macOS).
// Notes:
//   Available() is false where the platform has no such facility; OpenUrl() throws std::runtime_error on
//   failure.
//==========================================================================================================
class INativeUrlOpener {
public:
    virtual ~INativeUrlOpener() = default;
    virtual bool Available() const = 0;
    virtual void OpenUrl(const std::string& uri) = 0;
};

//==========================================================================================================
// IProcessSpawner
// Purpose: Runs argv[0] with the given arguments (no shell) and waits for it.
// Returns:
//   Child exit status.
// Throws:
//   std::system_error when the process cannot be started.
//==========================================================================================================
class IProcessSpawner {
public:
    virtual ~IProcessSpawner() = default;
    virtual int SpawnAndWait(const std::vector<std::string>& argv) = 0;
};

std::shared_ptr<INativeUrlOpener> makeNativeUrlOpener();
std::shared_ptr<IProcessSpawner> makeProcessSpawner();

// Subprocess fallbacks for the current platform, in the order they are tried.
std::vector<std::vector<std::string>> defaultFallbackCommands(const std::string& uri);

class SystemBrowserLauncher : public IBrowserLauncher {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   allowedHosts: Host allow-list for the launch check (default: google.com, googleapis.com).
    //   useNativeOpener: Try the platform opener before subprocess fallbacks (default: true).
    //==========================================================================================================
    struct Options {
        std::vector<std::string> allowedHosts;
        bool useNativeOpener{true};
    };

    SystemBrowserLauncher();
    explicit SystemBrowserLauncher(Options opts,
                                   std::shared_ptr<INativeUrlOpener> opener = nullptr,
                                   std::shared_ptr<IProcessSpawner> spawner = nullptr);

    //==========================================================================================================
    // Open
    // Purpose: Verifies the URI, then tries the native opener and each fallback command in turn. Failed
    //          attempts are logged and the next one is tried.
    // Throws:
    //   errors::AuthError(Security) before any attempt when the URI is unsafe;
    //   errors::AuthError(Launch) carrying the URI when every attempt fails.
    //==========================================================================================================
    void Open(const std::string& uri) override;

private:
    Options opts;
    std::shared_ptr<INativeUrlOpener> opener;
    std::shared_ptr<IProcessSpawner> spawner;
};

} // namespace deskauth
