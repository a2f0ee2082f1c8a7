// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_TOOL_HPP
#define PROSAIC_TOOL_HPP

#include "tool/GrammarLoader.hpp"
#include "tool/JsonProfileLoader.hpp"
#include "tool/JsonReport.hpp"

#endif // PROSAIC_TOOL_HPP
