//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Desktop sign-in example: runs one loopback PKCE flow and prints the (redacted) result
//==========================================================================================================

#include "logging/Logger.h"
#include "deskauth/Config.hpp"
#include "deskauth/FlowOrchestrator.hpp"
#include "deskauth/errors/Errors.h"
#include "deskauth/version.h"
#include <iostream>
#include <optional>

using namespace deskauth;

//==========================================================================================================
// getArgValue
// Purpose: Parses --key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--mode")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            if (a.substr(0, eq) == key) {
                return a.substr(eq + 1);
            }
        } else if (a == key && i + 1 < static_cast<size_t>(argc)) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage() {
    std::cout << "deskauth_signin " << getVersionString() << "\n"
              << "Usage: deskauth_signin [--mode=direct|proxied] [--config=\"k=v; k=v\"] [--timeout=<sec>]\n"
              << "                       [--log-level=debug|info|warn|error] [--log-file=<path>]\n";
}

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage();
            return 0;
        }
    }

    if (auto lvl = getArgValue(argc, argv, "--log-level"); lvl.has_value()) {
        Logger::setLogLevel(Logger::levelFromString(*lvl));
    }
    if (auto file = getArgValue(argc, argv, "--log-file"); file.has_value() && !file->empty()) {
        Logger::setLogFile(*file);
    }

    FlowConfig cfg;
    try {
        std::string cfgString = getArgValue(argc, argv, "--config").value_or("");
        if (auto mode = getArgValue(argc, argv, "--mode"); mode.has_value()) {
            cfgString += "; mode=" + *mode;
        }
        if (auto timeout = getArgValue(argc, argv, "--timeout"); timeout.has_value()) {
            cfgString += "; redirectTimeoutSeconds=" + *timeout;
        }
        cfg = ConfigLoader::Resolve(ConfigLoader::FromString(cfgString));
    } catch (const errors::AuthError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }

    OAuthFlowOrchestrator::Options opts;
    opts.config = cfg;
    OAuthFlowOrchestrator flow(std::move(opts));
    flow.SetStateChangedHandler([](FlowState s) {
        LOG_INFO("Sign-in state: {}", flowStateName(s));
    });

    auto fut = flow.Start();
    if (!flow.RedirectUri().empty()) {
        std::cout << "Waiting for the browser on " << flow.RedirectUri() << " ..." << std::endl;
    }
    try {
        auth::Credential cred = fut.get();
        if (cred.tokens) {
            std::cout << "access_token:  " << redactSecret(cred.tokens->accessToken) << "\n";
            if (cred.tokens->idToken) {
                std::cout << "id_token:      " << redactSecret(*cred.tokens->idToken) << "\n";
            }
            if (cred.tokens->refreshToken) {
                std::cout << "refresh_token: " << redactSecret(*cred.tokens->refreshToken) << "\n";
            }
            if (cred.tokens->expiresInSeconds) {
                std::cout << "expires_in:    " << *cred.tokens->expiresInSeconds << "\n";
            }
        }
        if (cred.customToken) {
            std::cout << "custom_token:  " << redactSecret(*cred.customToken) << "\n";
        }
        if (cred.user) {
            std::cout << "user:          " << cred.user->email << " (" << cred.user->uid << ")\n";
        }
    } catch (const errors::AuthError& e) {
        LOG_ERROR("{}: {}", errors::categoryName(e.category), e.what());
        std::cerr << errors::userMessageFor(e) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Sign-in failed: {}", e.what());
        return 1;
    }
    return 0;
}
