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

#include "resumableupload/internal/json_utils.h"
#include "resumableupload/internal/rfc3339_time.h"
#include <sstream>
#include <stdexcept>

namespace rup {
namespace internal {

namespace {
Status FieldError(nlohmann::json const& json, char const* fieldName, char const* expected)
{
    std::ostringstream os;
    os << "Error parsing field <" << fieldName << "> as " << expected << ", json=" << json;
    return Status(StatusCode::InvalidArgument, std::move(os).str());
}
}  // namespace

StatusOrVal<std::string> JsonUtils::ParseString(nlohmann::json const& json, char const* fieldName)
{
    if (json.count(fieldName) == 0)
        return std::string();
    auto const& f = json[fieldName];
    if (f.is_string())
        return f.get<std::string>();
    return FieldError(json, fieldName, "a string");
}

StatusOrVal<std::uint64_t> JsonUtils::ParseUnsignedLong(nlohmann::json const& json, char const* fieldName)
{
    if (json.count(fieldName) == 0)
        return std::uint64_t(0);
    auto const& f = json[fieldName];
    if (f.is_number_unsigned())
        return f.get<std::uint64_t>();
    if (f.is_string())
    {
        auto const& str = f.get_ref<std::string const&>();
        if (!str.empty() && str.find_first_not_of("0123456789") == std::string::npos)
        {
            try
            {
                return std::uint64_t(std::stoull(str));
            }
            catch (std::out_of_range const&)
            {
                // Reported below.
            }
        }
    }
    return FieldError(json, fieldName, "an std::uint64_t");
}

StatusOrVal<std::chrono::system_clock::time_point> JsonUtils::ParseRFC3339Timestamp(nlohmann::json const& json,
                                                                                    char const* fieldName)
{
    if (json.count(fieldName) == 0)
        return std::chrono::system_clock::time_point{};
    auto const& f = json[fieldName];
    if (f.is_string())
        return ParseRfc3339(f.get<std::string>());
    return FieldError(json, fieldName, "a timestamp");
}

StatusOrVal<std::map<std::string, std::string>> JsonUtils::ParseStringMap(nlohmann::json const& json,
                                                                         char const* fieldName)
{
    std::map<std::string, std::string> result;
    if (json.count(fieldName) == 0)
        return result;
    auto const& f = json[fieldName];
    if (!f.is_object())
        return FieldError(json, fieldName, "an object");
    for (auto const& kv : f.items())
    {
        if (!kv.value().is_string())
            return FieldError(json, fieldName, "an object of strings");
        result.emplace(kv.key(), kv.value().get<std::string>());
    }
    return result;
}

}  // namespace internal
}  // namespace rup
