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


#ifndef EDGEDEPLOY_COMMON_IO_HPP
#define EDGEDEPLOY_COMMON_IO_HPP

#include <fstream>
#include <istream>
#include <string>

#include <common/error.hpp>
#include <common/expected.hpp>

namespace edgedeploy {
namespace common {
namespace io {

using namespace std;

namespace error = edgedeploy::common::error;
namespace expected = edgedeploy::common::expected;

using ExpectedIfstream = expected::expected<ifstream, error::Error>;
using ExpectedOfstream = expected::expected<ofstream, error::Error>;
ExpectedIfstream OpenIfstream(const string &path);
ExpectedOfstream OpenOfstream(const string &path);

error::Error WriteStringIntoOfstream(ofstream &os, const string &data);

// Everything left in the stream.
expected::ExpectedString ReadAll(istream &is);

// Writes `data` beside `file_path` and renames it into place. Whoever watches the directory
// never sees a partial file.
error::Error WriteFileAtomically(const string &file_path, const string &data);

} // namespace io
} // namespace common
} // namespace edgedeploy

#endif // EDGEDEPLOY_COMMON_IO_HPP
