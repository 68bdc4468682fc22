// Copyright 2024 Andrew Karasyov
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <string>

namespace rup {
// clang-format off
constexpr auto RUP_VERSION_MAJOR = 0;
constexpr auto RUP_VERSION_MINOR = 1;
constexpr auto RUP_VERSION_PATCH = 0;
// clang-format on

/// The library version as `MAJOR.MINOR.PATCH`.
inline std::string VersionString()
{
    return std::to_string(RUP_VERSION_MAJOR) + "." + std::to_string(RUP_VERSION_MINOR) + "." +
           std::to_string(RUP_VERSION_PATCH);
}
}  // namespace rup
