/// @file docstore.hpp
/// @brief Umbrella header for the docstore-cpp library.
///
/// Include this single header for access to all public types:
/// Value, the merge-patch engine, filters and the matcher, dotted
/// updates, Config, the Database contract and InMemoryStore.

#pragma once

#include <docstore-cpp/config.hpp>
#include <docstore-cpp/database.hpp>
#include <docstore-cpp/error.hpp>
#include <docstore-cpp/json.hpp>
#include <docstore-cpp/lock.hpp>
#include <docstore-cpp/logging.hpp>
#include <docstore-cpp/matcher.hpp>
#include <docstore-cpp/memory_store.hpp>
#include <docstore-cpp/patch.hpp>
#include <docstore-cpp/query.hpp>
#include <docstore-cpp/update.hpp>
#include <docstore-cpp/value.hpp>
