/// @file litedoc.hpp
/// @brief Umbrella header for the litedoc-cpp library.
///
/// Include this single header for access to the parser, the document
/// tree, profiles, metadata, diagnostics and statistics. JSON export
/// lives in json.hpp and batch parsing in batch.hpp.

#pragma once

#include <litedoc-cpp/ast.hpp>
#include <litedoc-cpp/error.hpp>
#include <litedoc-cpp/metadata.hpp>
#include <litedoc-cpp/parser.hpp>
#include <litedoc-cpp/profile.hpp>
#include <litedoc-cpp/recovery.hpp>
#include <litedoc-cpp/span.hpp>
#include <litedoc-cpp/stats.hpp>
