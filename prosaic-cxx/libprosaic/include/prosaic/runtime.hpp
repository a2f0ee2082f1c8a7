// Copyright (c) 2025 The Prosaic Authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef PROSAIC_RUNTIME_HPP
#define PROSAIC_RUNTIME_HPP

#include "runtime/Codec.hpp"
#include "runtime/DefaultModel.hpp"
#include "runtime/Detector.hpp"
#include "runtime/Encoder.hpp"
#include "runtime/Errors.hpp"
#include "runtime/Grammar.hpp"
#include "runtime/HuffmanCoder.hpp"
#include "runtime/KeySearch.hpp"
#include "runtime/Listener.hpp"
#include "runtime/Model.hpp"
#include "runtime/Naturalness.hpp"
#include "runtime/Payload.hpp"
#include "runtime/Serializer.hpp"

#endif // PROSAIC_RUNTIME_HPP
