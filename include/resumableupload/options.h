// Copyright 2024 Andrew Karasyov
//
// Copyright 2021 Google LLC
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

#include <memory>
#include <set>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

namespace rup {

class Options;
namespace internal {
void CheckExpectedOptionsImpl(std::set<std::type_index> const&, Options const&, char const*);
Options MergeOptions(Options, Options);
}  // namespace internal

/**
 * A class that holds option structs indexed by their type.
 *
 * An "Option" is any struct that has a public `Type` member typedef. By
 * convention they are named like "FooOption". Each library defines its own set
 * of options, see `upload_options.h`.
 *
 * @code
 * struct EndpointOption
 * {
 *     using Type = std::string;
 * };
 *
 * auto opts = Options{}.Set<EndpointOption>("https://example.com/files/");
 * std::string const& endpoint = opts.Get<EndpointOption>();
 * @endcode
 */
class Options
{
private:
    template <typename T>
    using ValueTypeT = typename T::Type;

public:
    Options() = default;

    Options(Options const& rhs)
    {
        for (auto const& kv : rhs.m_map)
            m_map.emplace(kv.first, kv.second->Clone());
    }

    Options& operator=(Options const& rhs)
    {
        Options tmp(rhs);
        std::swap(m_map, tmp.m_map);
        return *this;
    }

    Options(Options&&) = default;
    Options& operator=(Options&&) = default;

    /**
     * Sets option `T` to the value @p v and returns a reference to `*this`.
     */
    template <typename T>
    Options& Set(ValueTypeT<T> v)
    {
        m_map[typeid(T)] = std::make_unique<Data<T>>(std::move(v));
        return *this;
    }

    /// Returns true if the option `T` is set.
    template <typename T>
    bool Has() const
    {
        return m_map.find(typeid(T)) != m_map.end();
    }

    /// Erases the option specified by the type `T`.
    template <typename T>
    void Unset()
    {
        m_map.erase(typeid(T));
    }

    /**
     * Returns a reference to the value for `T`, or a value-initialized default
     * if `T` was not set.
     */
    template <typename T>
    ValueTypeT<T> const& Get() const
    {
        static auto const* const DefaultValue = new ValueTypeT<T>{};
        auto const it = m_map.find(typeid(T));
        if (it == m_map.end())
            return *DefaultValue;
        return static_cast<Data<T> const*>(it->second.get())->m_value;
    }

    /**
     * Returns a reference to the value for `T`, inserting a value-initialized
     * one when it was not set.
     */
    template <typename T>
    ValueTypeT<T>& Lookup(ValueTypeT<T> initValue = {})
    {
        auto it = m_map.find(typeid(T));
        if (it == m_map.end())
            it = m_map.emplace(typeid(T), std::make_unique<Data<T>>(std::move(initValue))).first;
        return static_cast<Data<T>*>(it->second.get())->m_value;
    }

private:
    friend void internal::CheckExpectedOptionsImpl(std::set<std::type_index> const&, Options const&, char const*);
    friend Options internal::MergeOptions(Options, Options);

    class DataHolder
    {
    public:
        virtual ~DataHolder() = default;
        virtual std::unique_ptr<DataHolder> Clone() const = 0;
    };

    template <typename T>
    class Data : public DataHolder
    {
    public:
        explicit Data(ValueTypeT<T> v) : m_value(std::move(v)) {}
        ~Data() override = default;

        std::unique_ptr<DataHolder> Clone() const override { return std::make_unique<Data<T>>(*this); }

        ValueTypeT<T> m_value;
    };

    std::unordered_map<std::type_index, std::unique_ptr<DataHolder>> m_map;
};

/**
 * A template to hold a list of "option" types.
 */
template <typename... T>
struct OptionList
{
};

namespace internal {

/**
 * Logs a warning for every option in @p opts not listed in the `OptionList`.
 */
template <typename... T>
void CheckExpectedOptions(OptionList<T...> const&, Options const& opts, char const* caller)
{
    CheckExpectedOptionsImpl({typeid(T)...}, opts, caller);
}

/**
 * Combines two option bags, values in @p a take precedence over @p b.
 */
Options MergeOptions(Options a, Options b);

}  // namespace internal
}  // namespace rup
