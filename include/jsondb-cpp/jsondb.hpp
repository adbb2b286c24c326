/// @file jsondb.hpp
/// @brief Umbrella header for the jsondb-cpp library.
///
/// Include this single header for access to all public types:
/// Store, StoreOptions, Schema, Shape, Locator, path resolution,
/// JSON interop, logging, and Error.

#pragma once

#include <jsondb-cpp/error.hpp>
#include <jsondb-cpp/json.hpp>
#include <jsondb-cpp/log.hpp>
#include <jsondb-cpp/options.hpp>
#include <jsondb-cpp/path.hpp>
#include <jsondb-cpp/store.hpp>
#include <jsondb-cpp/types.hpp>
