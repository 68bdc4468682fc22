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

#include "resumableupload/options.h"
#include "util/scoped_log.h"
#include <gmock/gmock.h>
#include <set>
#include <string>

namespace rup {
namespace internal {
namespace {

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::UnorderedElementsAre;

struct IntOption
{
    using Type = int;
};

struct BoolOption
{
    using Type = bool;
};

struct StringOption
{
    using Type = std::string;
};

TEST(OptionsUseCase, SettingSimpleOptions)
{
    auto const opts = Options{}.Set<IntOption>(123).Set<BoolOption>(true);

    EXPECT_TRUE(opts.Has<IntOption>());
    EXPECT_TRUE(opts.Has<BoolOption>());
    EXPECT_FALSE(opts.Has<StringOption>());
}

TEST(OptionsUseCase, AppendingToComplexOption)
{
    struct TracingOption
    {
        using Type = std::set<std::string>;
    };

    Options opts;
    EXPECT_FALSE(opts.Has<TracingOption>());
    opts.Lookup<TracingOption>().insert("http");
    EXPECT_TRUE(opts.Has<TracingOption>());
    opts.Lookup<TracingOption>().insert("raw-client");

    EXPECT_THAT(opts.Lookup<TracingOption>(), UnorderedElementsAre("http", "raw-client"));
}

TEST(Options, SetAndGet)
{
    Options opts;
    EXPECT_EQ(0, opts.Get<IntOption>());
    EXPECT_TRUE(opts.Get<StringOption>().empty());

    opts.Set<IntOption>({});
    EXPECT_TRUE(opts.Has<IntOption>());
    EXPECT_EQ(0, opts.Get<IntOption>());
    opts.Set<IntOption>(123);
    EXPECT_EQ(123, opts.Get<IntOption>());

    opts.Set<StringOption>("foo");
    EXPECT_EQ("foo", opts.Get<StringOption>());
}

TEST(Options, Lookup)
{
    Options opts;

    int& x = opts.Lookup<IntOption>();
    EXPECT_TRUE(opts.Has<IntOption>());
    EXPECT_EQ(0, x);
    x = 42;
    EXPECT_EQ(42, opts.Get<IntOption>());

    opts.Unset<IntOption>();
    EXPECT_FALSE(opts.Has<IntOption>());
    EXPECT_EQ(7, opts.Lookup<IntOption>(7));
    // An existing value is not replaced by the initial value.
    EXPECT_EQ(7, opts.Lookup<IntOption>(9));
}

TEST(Options, CopyIsDeep)
{
    auto a = Options{}.Set<IntOption>(42).Set<StringOption>("foo");

    auto copy = a;
    copy.Set<IntOption>(1);
    EXPECT_EQ(42, a.Get<IntOption>());
    EXPECT_EQ(1, copy.Get<IntOption>());
    EXPECT_EQ("foo", copy.Get<StringOption>());
}

TEST(Options, Move)
{
    auto a = Options{}.Set<IntOption>(42).Set<BoolOption>(true);

    auto moved = std::move(a);
    EXPECT_EQ(42, moved.Get<IntOption>());
    EXPECT_TRUE(moved.Get<BoolOption>());
}

TEST(MergeOptions, FirstWins)
{
    auto a = Options{}.Set<IntOption>(1);
    auto b = Options{}.Set<IntOption>(2).Set<StringOption>("from b");

    auto merged = MergeOptions(std::move(a), std::move(b));
    EXPECT_EQ(1, merged.Get<IntOption>());
    EXPECT_EQ("from b", merged.Get<StringOption>());
    EXPECT_FALSE(merged.Has<BoolOption>());
}

TEST(CheckExpectedOptions, NoWarningForExpected)
{
    testing::internal::ScopedLog log;
    auto opts = Options{}.Set<BoolOption>({}).Set<IntOption>({});
    CheckExpectedOptions(OptionList<BoolOption, IntOption>{}, opts, "caller");
    EXPECT_TRUE(log.ExtractLines().empty());
}

TEST(CheckExpectedOptions, WarnsAboutUnexpected)
{
    testing::internal::ScopedLog log;
    auto opts = Options{}.Set<IntOption>({});
    CheckExpectedOptions(OptionList<BoolOption>{}, opts, "caller");
    EXPECT_THAT(log.ExtractLines(), Contains(HasSubstr("caller: Unexpected option")));
}

}  // namespace
}  // namespace internal
}  // namespace rup
