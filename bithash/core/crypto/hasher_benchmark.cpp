/*
   Copyright 2023 The Bithash Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include <numeric>

#include <benchmark/benchmark.h>

#include <bithash/core/common/base.hpp>
#include <bithash/core/crypto/hash160.hpp>
#include <bithash/core/crypto/hash256.hpp>

namespace bithash::crypto {

static constexpr size_t kMaxInputSize{64_KiB};

static Bytes make_input() {
    Bytes ret(kMaxInputSize, 0);
    std::iota(ret.begin(), ret.end(), uint8_t{0});
    return ret;
}

const Bytes input_bytes{make_input()};

template <HashAlgorithm A>
void bench_update(benchmark::State& state) {
    auto engine{A::engine()};
    const ByteView data(input_bytes.data(), static_cast<size_t>(state.range()));
    for ([[maybe_unused]] auto _ : state) {
        engine.update(data);
    }
    auto hash{A::from_engine(std::move(engine))};
    benchmark::DoNotOptimize(hash);
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

template <HashAlgorithm A>
void bench_one_shot(benchmark::State& state) {
    const ByteView data(input_bytes.data(), static_cast<size_t>(state.range()));
    for ([[maybe_unused]] auto _ : state) {
        auto hash{A::hash(data)};
        benchmark::DoNotOptimize(hash);
    }
    state.SetBytesProcessed(state.range() * static_cast<int64_t>(state.iterations()));
}

BENCHMARK_TEMPLATE(bench_update, Hash160)->Arg(10)->Arg(1_KiB)->Arg(64_KiB);
BENCHMARK_TEMPLATE(bench_update, Hash256)->Arg(10)->Arg(1_KiB)->Arg(64_KiB);
BENCHMARK_TEMPLATE(bench_one_shot, Hash160)->Arg(10)->Arg(1_KiB)->Arg(64_KiB);
BENCHMARK_TEMPLATE(bench_one_shot, Hash256)->Arg(10)->Arg(1_KiB)->Arg(64_KiB);

}  // namespace bithash::crypto
