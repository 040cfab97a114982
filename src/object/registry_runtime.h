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

#pragma once

#include <string>
#include <boost/optional.hpp>
#include "../config.h"
#include "../util/log.h"
#include "shared_object_registry.h"

namespace arbor {

    /**
     * Settings applied once, when the global registry is created.
     */
    struct RegistryConfig {
        // Arena slots reserved up front
        size_t initial_capacity;

        // Log threshold to install; none leaves the current level alone
        boost::optional<LogLevel> log_level;

        // Log destination; empty keeps stderr
        std::string log_file;

        RegistryConfig()
            : initial_capacity(config::registry::kInitialCapacity) {}

        /**
         * Defaults overridden by ARBOR_REGISTRY_CAPACITY, ARBOR_LOG_LEVEL
         * and ARBOR_LOG_FILE. Out-of-range or unparsable values are
         * ignored with a warning.
         */
        static RegistryConfig from_env();
    };

    /**
     * Create the process-wide registry. Idempotent: later calls, whatever
     * their config, are no-ops. The instance is never torn down.
     */
    void init_global_registry(const RegistryConfig& config = RegistryConfig::from_env());

    bool global_registry_initialized();

    /**
     * The process-wide registry.
     * @throws ObjectError RegistryNotInitialized before init_global_registry()
     */
    SharedObjectRegistry& global_registry();

    // nullptr before init_global_registry()
    SharedObjectRegistry* try_global_registry();

    /**
     * For convenience constructors only: using the registry before
     * init_global_registry() is a programming error, so this logs and
     * aborts instead of throwing.
     */
    SharedObjectRegistry& global_registry_or_abort();

} // namespace arbor
