/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "registry_runtime.h"
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/system/error_code.hpp>

namespace arbor {

    namespace {
        std::mutex init_mutex;
        std::atomic<SharedObjectRegistry*> instance{nullptr};

        void open_log_file(const std::string& log_file) {
            const boost::filesystem::path path(log_file);
            if (path.has_parent_path()) {
                boost::system::error_code ec;
                boost::filesystem::create_directories(path.parent_path(), ec);
                if (ec) {
                    warning() << "cannot create log directory " << path.parent_path().string()
                              << ": " << ec.message() << "; logging to stderr";
                    return;
                }
            }
            // Kept open for the life of the process, like the registry itself
            FILE* f = std::fopen(path.string().c_str(), "a");
            if (!f) {
                warning() << "cannot open log file " << log_file << ": "
                          << errnoWithDescription() << "; logging to stderr";
                return;
            }
            Logger::setLogFile(f);
        }

        void apply_logging(const RegistryConfig& config) {
            if (config.log_level) {
                logLevel.store(*config.log_level, std::memory_order_relaxed);
            }
            if (!config.log_file.empty()) {
                open_log_file(config.log_file);
            }
        }
    }

    RegistryConfig RegistryConfig::from_env() {
        RegistryConfig config;

        if (const char* capacity = std::getenv(config::registry::kCapacityEnvVar)) {
            char* end = nullptr;
            const unsigned long long value = std::strtoull(capacity, &end, 10);
            if (end != capacity && *end == '\0' &&
                value >= config::registry::kMinCapacity &&
                value <= config::registry::kMaxInitialCapacity) {
                config.initial_capacity = static_cast<size_t>(value);
            } else {
                warning() << "ignoring " << config::registry::kCapacityEnvVar << "='" << capacity
                          << "' (expected " << static_cast<unsigned long>(config::registry::kMinCapacity)
                          << ".." << static_cast<unsigned long>(config::registry::kMaxInitialCapacity) << ")";
            }
        }

        if (const char* level = std::getenv(config::logging::kLevelEnvVar)) {
            config.log_level = parseLogLevel(level);
            if (!config.log_level) {
                warning() << "ignoring " << config::logging::kLevelEnvVar << "='" << level
                          << "' (valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE)";
            }
        }

        if (const char* file = std::getenv(config::logging::kFileEnvVar)) {
            config.log_file = file;
        }

        return config;
    }

    void init_global_registry(const RegistryConfig& config) {
        std::lock_guard<std::mutex> lock(init_mutex);
        if (instance.load(std::memory_order_acquire)) {
            debug() << "global object registry already initialized";
            return;
        }

        apply_logging(config);

        // Never destroyed; lives until process exit
        instance.store(new SharedObjectRegistry(config.initial_capacity), std::memory_order_release);
        info() << "global object registry initialized (capacity "
               << static_cast<unsigned long>(config.initial_capacity) << ")";
    }

    bool global_registry_initialized() {
        return instance.load(std::memory_order_acquire) != nullptr;
    }

    SharedObjectRegistry* try_global_registry() {
        return instance.load(std::memory_order_acquire);
    }

    SharedObjectRegistry& global_registry() {
        SharedObjectRegistry* registry = instance.load(std::memory_order_acquire);
        if (!registry) {
            throw ObjectError(ObjectErrc::RegistryNotInitialized);
        }
        return *registry;
    }

    SharedObjectRegistry& global_registry_or_abort() {
        SharedObjectRegistry* registry = instance.load(std::memory_order_acquire);
        if (!registry) {
            severe() << "object registry used before init_global_registry()";
            std::abort();
        }
        return *registry;
    }

} // namespace arbor
