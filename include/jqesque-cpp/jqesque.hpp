/// @file jqesque.hpp
/// @brief Umbrella header for the jqesque-cpp library.
///
/// Include this single header for access to all public types:
/// Assignment, Path, PathSegment, Operation, Separator, the parser, the
/// operation engine, JSON interop helpers, and ParseError/ApplyError.

#pragma once

#include <jqesque-cpp/apply.hpp>
#include <jqesque-cpp/assignment.hpp>
#include <jqesque-cpp/error.hpp>
#include <jqesque-cpp/json.hpp>
#include <jqesque-cpp/parse.hpp>
#include <jqesque-cpp/types.hpp>
