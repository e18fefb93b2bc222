/// @file jsonmanip.hpp
/// @brief Umbrella header for the jsonmanip-cpp library.
///
/// Include this single header for access to all public types:
/// Value, Object, Decimal, Node, Query, Filter, Manipulator, make_patch
/// and the Error types. nlohmann/json interop lives in json.hpp.

#pragma once

#include <jsonmanip-cpp/decimal.hpp>
#include <jsonmanip-cpp/diff.hpp>
#include <jsonmanip-cpp/error.hpp>
#include <jsonmanip-cpp/manipulator.hpp>
#include <jsonmanip-cpp/node.hpp>
#include <jsonmanip-cpp/query.hpp>
#include <jsonmanip-cpp/value.hpp>
