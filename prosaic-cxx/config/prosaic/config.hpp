// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_CONFIG_HPP
#define PROSAIC_CONFIG_HPP

#ifndef PROSAIC_VERSION
#define PROSAIC_VERSION "0.0 (unknown)"
#endif

#define PROSAIC_STRFY_INTERNAL(MACRO) #MACRO
#define PROSAIC_STRFY(MACRO) PROSAIC_STRFY_INTERNAL(MACRO)

#endif // PROSAIC_CONFIG_HPP
