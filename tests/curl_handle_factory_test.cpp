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

#include "resumableupload/internal/curl_handle_factory.h"
#include <gmock/gmock.h>

namespace rup {
namespace internal {
namespace {

TEST(CurlHandleFactoryTest, CreatesMatchingFactory)
{
    EXPECT_NE(nullptr, dynamic_cast<DefaultCurlHandleFactory*>(CreateCurlHandleFactory(0).get()));
    EXPECT_NE(nullptr, dynamic_cast<PooledCurlHandleFactory*>(CreateCurlHandleFactory(4).get()));
}

TEST(CurlHandleFactoryTest, DefaultFactoryCreatesHandles)
{
    DefaultCurlHandleFactory factory;
    auto handle = factory.CreateHandle();
    ASSERT_NE(nullptr, handle.get());
    factory.CleanupHandle(std::move(handle));
    EXPECT_EQ(nullptr, handle.get());
}

TEST(CurlHandleFactoryTest, PooledFactoryReusesHandles)
{
    PooledCurlHandleFactory factory(2);
    EXPECT_EQ(0U, factory.CurrentHandleCount());

    auto h1 = factory.CreateHandle();
    auto* raw = h1.get();
    factory.CleanupHandle(std::move(h1));
    EXPECT_EQ(1U, factory.CurrentHandleCount());

    auto h2 = factory.CreateHandle();
    EXPECT_EQ(raw, h2.get());
    EXPECT_EQ(0U, factory.CurrentHandleCount());
    factory.CleanupHandle(std::move(h2));
}

TEST(CurlHandleFactoryTest, PooledFactoryIsBounded)
{
    PooledCurlHandleFactory factory(2);
    auto h1 = factory.CreateHandle();
    auto h2 = factory.CreateHandle();
    auto h3 = factory.CreateHandle();
    factory.CleanupHandle(std::move(h1));
    factory.CleanupHandle(std::move(h2));
    factory.CleanupHandle(std::move(h3));
    EXPECT_EQ(2U, factory.CurrentHandleCount());
}

}  // namespace
}  // namespace internal
}  // namespace rup
