/// @file slides.hpp
/// @brief Umbrella header for the slides-cpp library.
///
/// Include this single header for access to all public types:
/// DocumentStore, Request and its variants, the handlers and batch
/// dispatcher, path and field-mask helpers, IdFactory, StoreOptions,
/// logging, Value, and Error.

#pragma once

#include <slides-cpp/batch_update.hpp>
#include <slides-cpp/error.hpp>
#include <slides-cpp/field_mask.hpp>
#include <slides-cpp/handlers.hpp>
#include <slides-cpp/identity.hpp>
#include <slides-cpp/locator.hpp>
#include <slides-cpp/log.hpp>
#include <slides-cpp/options.hpp>
#include <slides-cpp/path.hpp>
#include <slides-cpp/request.hpp>
#include <slides-cpp/store.hpp>
#include <slides-cpp/text.hpp>
#include <slides-cpp/value.hpp>
