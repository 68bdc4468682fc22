// Copyright 2024 Andrew Karasyov
//
// Copyright 2018 Google LLC
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

#include "resumableupload/status.h"
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace rup {

/**
 * Holds a value or a `Status` indicating why there is no value.
 *
 * `StatusOrVal<T>` represents either a usable `T` value or a `Status` object
 * explaining why a `T` value is not present. Typical usage of `StatusOrVal<T>`
 * looks like usage of a smart pointer, or even a `std::optional<T>`, in that
 * you first check its validity using a conversion to bool (or by calling
 * `StatusOrVal::Ok()`), then you may dereference the object to access the
 * contained value.
 *
 * @code
 * StatusOrVal<UploadSession> session = store.Load(id);
 * if (!session)
 * {
 *     RUP_LOG_ERROR("cannot load {}: {}", id, session.GetStatus());
 *     return;
 * }
 * Resume(*session);
 * @endcode
 *
 * Calling `Value()` on an object without a value throws `RuntimeStatusError`.
 */
template <typename T>
class StatusOrVal final
{
public:
    using value_type = T;

    /**
     * Initializes with an error status (Unknown).
     */
    StatusOrVal() : StatusOrVal(Status(StatusCode::Unknown, "default")) {}

    StatusOrVal(StatusOrVal const&) = default;
    StatusOrVal& operator=(StatusOrVal const&) = default;
    StatusOrVal(StatusOrVal&&) = default;
    StatusOrVal& operator=(StatusOrVal&&) = default;

    /**
     * Creates a new `StatusOrVal<T>` holding the error condition @p rhs.
     *
     * @throws std::invalid_argument if `rhs.Ok()` is true, an OK status
     *     carries no value.
     */
    // NOLINTNEXTLINE(google-explicit-constructor)
    StatusOrVal(Status rhs) : m_status(std::move(rhs))
    {
        if (m_status.Ok())
        {
            throw std::invalid_argument("StatusOrVal<T> constructed with an OK status and no value");
        }
    }

    StatusOrVal& operator=(Status status)
    {
        *this = StatusOrVal(std::move(status));
        return *this;
    }

    template <typename U = T,
              typename std::enable_if<!std::is_same<StatusOrVal, typename std::decay<U>::type>::value &&
                                          !std::is_same<Status, typename std::decay<U>::type>::value,
                                      int>::type = 0>
    StatusOrVal& operator=(U&& rhs)
    {
        m_status = Status();
        m_value = std::forward<U>(rhs);
        return *this;
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    StatusOrVal(T&& rhs) : m_value(std::move(rhs)) {}

    // NOLINTNEXTLINE(google-explicit-constructor)
    StatusOrVal(T const& rhs) : m_value(rhs) {}

    bool Ok() const { return m_status.Ok(); }
    explicit operator bool() const { return m_status.Ok(); }

    //@{
    /**
     * @name Deference operators.
     *
     * @warning Using these operators when `Ok() == false` results in undefined
     *     behavior.
     */
    T& operator*() & { return *m_value; }
    T const& operator*() const& { return *m_value; }
    T&& operator*() && { return *std::move(m_value); }
    T const&& operator*() const&& { return *std::move(m_value); }
    //@}

    //@{
    /**
     * @name Member access operators.
     *
     * @warning Using these operators when `Ok() == false` results in undefined
     *     behavior.
     */
    T* operator->() & { return &*m_value; }
    T const* operator->() const& { return &*m_value; }
    //@}

    //@{
    /**
     * @name Value accessors.
     *
     * @return All these member functions return a (properly ref and
     *     const-qualified) reference to the underlying value.
     *
     * @throws `RuntimeStatusError` with the contained `Status` if `!Ok()`.
     */
    T& Value() &
    {
        CheckHasValue();
        return **this;
    }

    T const& Value() const&
    {
        CheckHasValue();
        return **this;
    }

    T&& Value() &&
    {
        CheckHasValue();
        return std::move(**this);
    }

    T const&& Value() const&&
    {
        CheckHasValue();
        return std::move(**this);
    }
    //@}

    //@{
    /**
     * @name Status accessors.
     *
     * @return A reference to the contained `Status`.
     */
    Status const& GetStatus() const& { return m_status; }
    Status&& GetStatus() && { return std::move(m_status); }
    //@}

private:
    void CheckHasValue() const&
    {
        if (!Ok())
        {
            throw RuntimeStatusError(m_status);
        }
    }

    Status m_status;
    std::optional<T> m_value;
};

template <typename T>
bool operator==(StatusOrVal<T> const& a, StatusOrVal<T> const& b)
{
    if (!a || !b)
        return a.GetStatus() == b.GetStatus();
    return *a == *b;
}

template <typename T>
bool operator!=(StatusOrVal<T> const& a, StatusOrVal<T> const& b)
{
    return !(a == b);
}

template <typename T>
StatusOrVal<T> MakeStatusOrVal(T rhs)
{
    return StatusOrVal<T>(std::move(rhs));
}

}  // namespace rup
