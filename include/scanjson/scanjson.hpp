#pragma once

/// @file scanjson.hpp
/// @brief Main header file for the scanjson library.

#include "config.hpp"
#include "error.hpp"
#include "types.hpp"
#include "buffer.hpp"
#include "scanner.hpp"
#include "number.hpp"
#include "escape.hpp"
#include "extractor.hpp"
#include "conversion.hpp"
#include "meta_key.hpp"
#include "read_options.hpp"
#include "reader.hpp"
