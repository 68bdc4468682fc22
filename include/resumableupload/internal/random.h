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

#include <random>
#include <string>

namespace rup {
namespace internal {

using DefaultPRNG = std::mt19937_64;

/**
 * Creates a new PRNG seeded from `std::random_device`.
 */
DefaultPRNG MakeDefaultPRNG();

/**
 * Returns a string of @p n characters sampled (with replacement) from
 * @p population.
 */
std::string Sample(DefaultPRNG& gen, int n, std::string const& population);

}  // namespace internal
}  // namespace rup
