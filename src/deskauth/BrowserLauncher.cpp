//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BrowserLauncher.cpp
// Purpose: Native URL opening and shell-free subprocess fallbacks for launching the system browser
//==========================================================================================================

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#elif defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <ApplicationServices/ApplicationServices.h>
#include <spawn.h>
#include <sys/wait.h>
#else
#include <spawn.h>
#include <sys/wait.h>
#endif

#include "deskauth/BrowserLauncher.hpp"
#include "deskauth/auth/UriSafety.hpp"
#include "deskauth/errors/Errors.h"
#include "logging/Logger.h"

#ifndef _WIN32
extern char** environ;
#endif

namespace deskauth {

namespace {

class PlatformUrlOpener : public INativeUrlOpener {
public:
    bool Available() const override {
#if defined(_WIN32) || defined(__APPLE__)
        return true;
#else
        return false;
#endif
    }

    void OpenUrl(const std::string& uri) override {
#ifdef _WIN32
        std::wstring wuri = ::Utf8ToWString(uri);
        HINSTANCE result = ::ShellExecuteW(nullptr, L"open", wuri.c_str(), nullptr, nullptr, SW_SHOWNORMAL);
        if (reinterpret_cast<INT_PTR>(result) <= 32) {
            throw std::runtime_error("ShellExecuteW failed with code " +
                                     std::to_string(reinterpret_cast<INT_PTR>(result)));
        }
#elif defined(__APPLE__)
        CFURLRef urlRef = ::CFURLCreateWithBytes(nullptr, reinterpret_cast<const UInt8*>(uri.data()),
                                                 static_cast<CFIndex>(uri.size()), kCFStringEncodingUTF8, nullptr);
        if (!urlRef) {
            throw std::runtime_error("CFURLCreateWithBytes rejected the URL");
        }
        OSStatus st = ::LSOpenCFURLRef(urlRef, nullptr);
        ::CFRelease(urlRef);
        if (st != noErr) {
            throw std::runtime_error("LSOpenCFURLRef failed with status " + std::to_string(static_cast<int>(st)));
        }
#else
        (void)uri;
        throw std::runtime_error("No native URL opener on this platform");
#endif
    }
};

class PlatformProcessSpawner : public IProcessSpawner {
public:
    int SpawnAndWait(const std::vector<std::string>& argv) override {
        if (argv.empty()) {
            throw std::system_error(std::make_error_code(std::errc::invalid_argument), "empty command");
        }
#ifdef _WIN32
        // Launch URIs carry no spaces or quotes; only empty or spaced arguments need quoting
        std::wstring cmdline;
        for (const auto& a : argv) {
            if (!cmdline.empty()) {
                cmdline += L' ';
            }
            if (a.empty() || a.find_first_of(" \t") != std::string::npos) {
                cmdline += L'"' + ::Utf8ToWString(a) + L'"';
            } else {
                cmdline += ::Utf8ToWString(a);
            }
        }
        STARTUPINFOW si{};
        si.cb = sizeof(si);
        si.dwFlags = STARTF_USESHOWWINDOW;
        si.wShowWindow = SW_HIDE;
        PROCESS_INFORMATION pi{};
        if (!::CreateProcessW(nullptr, cmdline.data(), nullptr, nullptr, FALSE, CREATE_NO_WINDOW,
                              nullptr, nullptr, &si, &pi)) {
            throw std::system_error(static_cast<int>(::GetLastError()), std::system_category(),
                                    "CreateProcessW " + argv.front());
        }
        ::WaitForSingleObject(pi.hProcess, INFINITE);
        DWORD code = 1;
        ::GetExitCodeProcess(pi.hProcess, &code);
        ::CloseHandle(pi.hThread);
        ::CloseHandle(pi.hProcess);
        return static_cast<int>(code);
#else
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            args.push_back(const_cast<char*>(a.c_str()));
        }
        args.push_back(nullptr);
        pid_t pid = 0;
        int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
        if (rc != 0) {
            throw std::system_error(rc, std::generic_category(), "posix_spawnp " + argv.front());
        }
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::system_error(errno, std::generic_category(), "waitpid " + argv.front());
            }
        }
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
#endif
    }
};

} // namespace

std::shared_ptr<INativeUrlOpener> makeNativeUrlOpener() {
    return std::make_shared<PlatformUrlOpener>();
}

std::shared_ptr<IProcessSpawner> makeProcessSpawner() {
    return std::make_shared<PlatformProcessSpawner>();
}

std::vector<std::vector<std::string>> defaultFallbackCommands(const std::string& uri) {
#ifdef _WIN32
    // Not cmd.exe: it expands %VAR% sequences even inside quotes
    return {{"rundll32.exe", "url.dll,FileProtocolHandler", uri}};
#elif defined(__APPLE__)
    return {{"open", uri}};
#else
    return {{"xdg-open", uri}};
#endif
}

SystemBrowserLauncher::SystemBrowserLauncher()
    : SystemBrowserLauncher(Options{}) {}

SystemBrowserLauncher::SystemBrowserLauncher(Options o,
                                             std::shared_ptr<INativeUrlOpener> op,
                                             std::shared_ptr<IProcessSpawner> sp)
    : opts(std::move(o)), opener(std::move(op)), spawner(std::move(sp)) {
    if (opts.allowedHosts.empty()) {
        opts.allowedHosts = auth::defaultAllowedHosts();
    }
    if (!opener) {
        opener = makeNativeUrlOpener();
    }
    if (!spawner) {
        spawner = makeProcessSpawner();
    }
}

void SystemBrowserLauncher::Open(const std::string& uri) {
    auth::checkLaunchUri(uri, opts.allowedHosts);

    if (opts.useNativeOpener && opener->Available()) {
        try {
            opener->OpenUrl(uri);
            LOG_INFO("BrowserLauncher: opened browser with native opener");
            return;
        } catch (const std::exception& e) {
            LOG_WARN("BrowserLauncher: native opener failed: {}", e.what());
        }
    }

    for (const auto& cmd : defaultFallbackCommands(uri)) {
        try {
            int code = spawner->SpawnAndWait(cmd);
            if (code == 0) {
                LOG_INFO("BrowserLauncher: opened browser with {}", cmd.front());
                return;
            }
            LOG_WARN("BrowserLauncher: {} exited with status {}", cmd.front(), code);
        } catch (const std::system_error& e) {
            LOG_WARN("BrowserLauncher: {} could not be started: {}", cmd.front(), e.what());
        }
    }

    LOG_ERROR("BrowserLauncher: every launch attempt failed");
    throw errors::LaunchError("Could not open a web browser. Open the sign-in link manually.", uri);
}

} // namespace deskauth
