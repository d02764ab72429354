// purets/lint/module_tables.hpp - Name tables consulted by the rules
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace purets::lint::tables
{

template <size_t N>
[[nodiscard]] constexpr bool contains(
  const std::array<std::string_view, N> & table, std::string_view name) noexcept
{
  return std::find(table.begin(), table.end(), name) != table.end();
}

// ============================================================================
// Node.js modules
// ============================================================================

inline constexpr std::array<std::string_view, 42> k_node_builtins = {
  "assert",  "async_hooks", "buffer",      "child_process", "cluster",
  "console", "constants",   "crypto",      "dgram",         "diagnostics_channel",
  "dns",     "domain",      "events",      "fs",            "http",
  "http2",   "https",       "inspector",   "module",        "net",
  "os",      "path",        "perf_hooks",  "process",       "punycode",
  "querystring", "readline", "repl",       "stream",        "string_decoder",
  "sys",     "timers",      "tls",         "trace_events",  "tty",
  "url",     "util",        "v8",          "vm",            "wasi",
  "worker_threads", "zlib",
};

/// Modules whose `/promises` variant is preferred.
inline constexpr std::array<std::string_view, 5> k_prefer_promises = {
  "fs", "dns", "stream", "timers", "readline",
};

// ============================================================================
// Libraries
// ============================================================================

inline constexpr std::array<std::string_view, 4> k_forbidden_libraries = {
  "jquery", "lodash", "underscore", "rxjs",
};

struct LibraryAlternative
{
  std::string_view library;
  std::string_view alternative;
};

inline constexpr std::array<LibraryAlternative, 2> k_library_alternatives = {{
  {"minimist", "node:util parseArgs"},
  {"yargs", "node:util parseArgs"},
}};

/// Extensions accepted on relative import specifiers.
inline constexpr std::array<std::string_view, 9> k_import_extensions = {
  ".ts", ".tsx", ".js", ".jsx", ".mts", ".cts", ".mjs", ".cjs", ".json",
};

// ============================================================================
// Gated globals and types
// ============================================================================

inline constexpr std::array<std::string_view, 11> k_dom_globals = {
  "document", "window", "navigator", "location", "localStorage", "sessionStorage",
  "history",  "screen", "alert",     "confirm",  "prompt",
};

inline constexpr std::array<std::string_view, 15> k_dom_types = {
  "HTMLElement", "HTMLDivElement", "HTMLInputElement", "Document",   "Window",
  "Navigator",   "Location",       "Element",          "Node",       "Event",
  "MouseEvent",  "KeyboardEvent",  "DOMParser",        "XMLSerializer", "Storage",
};

inline constexpr std::array<std::string_view, 5> k_net_globals = {
  "fetch", "XMLHttpRequest", "WebSocket", "EventSource", "ServiceWorker",
};

inline constexpr std::array<std::string_view, 9> k_net_types = {
  "Response",  "Request",     "Headers",       "RequestInit",
  "XMLHttpRequest", "WebSocket", "EventSource", "ServiceWorker",
  "ServiceWorkerRegistration",
};

inline constexpr std::array<std::string_view, 10> k_timer_functions = {
  "setTimeout",   "setInterval",   "setImmediate",   "requestAnimationFrame",
  "requestIdleCallback", "clearTimeout", "clearInterval", "clearImmediate",
  "cancelAnimationFrame", "cancelIdleCallback",
};

// ============================================================================
// Arrays
// ============================================================================

inline constexpr std::array<std::string_view, 9> k_mutating_array_methods = {
  "push", "pop", "shift", "unshift", "splice", "sort", "reverse", "fill", "copyWithin",
};

}  // namespace purets::lint::tables
