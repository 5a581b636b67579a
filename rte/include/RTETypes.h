// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Resilient Test Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Full terms: see LICENSE

#pragma once

#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Locator strategy of a selector candidate
 *
 * Declaration order is the resolution priority: most stable first.
 */
enum class SelectorStrategy { TestId, Role, Text, Semantic, Structural, Css };

/**
 * @brief Category assigned to a generated test case
 */
enum class TestCategory { Functional, Api, Visual };

/**
 * @brief Global scheduling mode of an execution policy
 */
enum class ExecutionMode { Sequential, Parallel, Smart };

// Textual forms ("test_id", "role", ... / "functional", "api", "visual" / "sequential", "parallel", "smart")
const char *toString(SelectorStrategy strategy);
const char *toString(TestCategory category);
const char *toString(ExecutionMode mode);

// Return nullopt for unknown names. Matching is exact (lower case).
std::optional<SelectorStrategy> parseSelectorStrategy(const std::string &text);
std::optional<TestCategory> parseTestCategory(const std::string &text);
std::optional<ExecutionMode> parseExecutionMode(const std::string &text);

}  // namespace RTE
