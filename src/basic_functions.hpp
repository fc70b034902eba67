#pragma once

#include "client_function.hpp"

#include <functional>
#include <string>

namespace genui {

// Hands a URL to whatever opens links on this host. Must not block.
using UrlLauncher = std::function<void(const std::string& url)>;

// Registers the built-in validation, formatting and logic functions:
// and, or, not, required, regex, length, numeric, email, formatString,
// formatNumber, formatCurrency, formatDate, pluralize, openUrl.
// `launcher` backs openUrl; when empty, accepted URLs are only logged.
void RegisterBasicFunctions(FunctionRegistry* registry, UrlLauncher launcher = nullptr);

}  // namespace genui
