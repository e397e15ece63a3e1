// Copyright 2026 The edgedeploy Authors
//
//    Licensed under the Apache License, Version 2.0 (the "License");
//    you may not use this file except in compliance with the License.
//    You may obtain a copy of the License at
//
//        http://www.apache.org/licenses/LICENSE-2.0
//
//    Unless required by applicable law or agreed to in writing, software
//    distributed under the License is distributed on an "AS IS" BASIS,
//    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//    See the License for the specific language governing permissions and
//    limitations under the License.

#ifndef EDGEDEPLOY_COMMON_OPTIONAL_HPP
#define EDGEDEPLOY_COMMON_OPTIONAL_HPP

#include <config.h>

#if EDGEDEPLOY_CXX_STANDARD < 17
#error edgedeploy needs C++17 or later
#endif

#include <optional>

namespace edgedeploy {
namespace common {
namespace optional {

using std::nullopt;
using std::optional;

} // namespace optional
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_OPTIONAL_HPP
