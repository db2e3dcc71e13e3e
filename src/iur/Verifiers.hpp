// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <iur/Element.hpp>

namespace uniui::iur
{

/// @brief Ensures every id in the tree is unique.
/// @throws ConfigurationError naming the first duplicated id.
void verifyUniqueIds(Element const& root);

/// @brief Ensures every label `for` reference names an existing text input id.
/// @throws ConfigurationError naming the dangling reference and the available input ids.
void verifyLabelRefs(Element const& root);

/// @brief Ensures handlers are well formed: non-empty names, remote calls with module and function.
/// @throws ConfigurationError naming the offending element.
void verifyHandlers(Element const& root);

/// @brief Runs all verifiers in order.
void verifyAll(Element const& root);

} // namespace uniui::iur
