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

#include "resumableupload/internal/utils.h"
#include <optional>
#include <string>

namespace rup {
namespace testing {
namespace internal {

/**
 * Sets (or unsets, given an empty optional) an environment variable and
 * restores its previous value on destruction.
 */
class ScopedEnvironment
{
public:
    ScopedEnvironment(std::string variable, std::optional<std::string> const& value)
        : m_variable(std::move(variable)), m_previous(rup::internal::GetEnv(m_variable.c_str()))
    {
        rup::internal::SetEnv(m_variable.c_str(), value);
    }
    ~ScopedEnvironment() { rup::internal::SetEnv(m_variable.c_str(), m_previous); }

    ScopedEnvironment(ScopedEnvironment const&) = delete;
    ScopedEnvironment& operator=(ScopedEnvironment const&) = delete;

private:
    std::string m_variable;
    std::optional<std::string> m_previous;
};

}  // namespace internal
}  // namespace testing
}  // namespace rup
