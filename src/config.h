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
#include <cstdint>
#include <cstddef>

namespace arbor {
namespace config {

// Object registry configuration
namespace registry {
    constexpr size_t kInitialCapacity = 256;         // Slots reserved up front
    constexpr size_t kMaxCapacity = (1ULL << 32) - 1; // Top slot index reserved for ObjectId::invalid()
    constexpr uint32_t kFirstGeneration = 1;         // Generation 0 is never issued

    // For runtime configuration via environment
    constexpr const char* kCapacityEnvVar = "ARBOR_REGISTRY_CAPACITY";
    constexpr size_t kMinCapacity = 16;
    constexpr size_t kMaxInitialCapacity = 1 << 24;
}

// Logging configuration
namespace logging {
    constexpr const char* kLevelEnvVar = "ARBOR_LOG_LEVEL";
    constexpr const char* kFileEnvVar = "ARBOR_LOG_FILE";
    constexpr const char* kThreadName = "ARBOR";
}

// Debug tree output
namespace tree_format {
    constexpr size_t kDefaultIndent = 2;
}

} // namespace config
} // namespace arbor
