#pragma once

/// @file wasm.hpp
/// @brief Main include header for seedbed_wasm

#include "fwd.hpp"
#include "types.hpp"
#include "memory.hpp"
#include "module.hpp"
#include "instance.hpp"
