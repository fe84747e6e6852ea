#include "benchmark/benchmark.h"

#include "../src/fpround.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>
#include <string>
#include <utility>
#include <vector>

//==================================================================================================
//
//==================================================================================================

template <typename Target, typename Source>
static Target ReinterpretBits(Source const& source)
{
    static_assert(sizeof(Target) == sizeof(Source), "size mismatch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

//==================================================================================================
//
//==================================================================================================

static constexpr int NumFloats = 1 << 13;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
#ifdef _MSC_VER
    return _strdup(buf); // leak...
#else
    return strdup(buf); // leak...
#endif
}

struct BenchDtoa
{
    static char const* Name() { return "Dtoa"; }
    uint64_t operator()(double v, int /*precision*/) const {
        char buffer[fpround::DtoaMinBufferLength];
        fpround::Dtoa(buffer, v);
        return static_cast<unsigned char>(buffer[0]);
    }
    uint64_t operator()(float v, int /*precision*/) const {
        char buffer[fpround::FtoaMinBufferLength];
        fpround::Ftoa(buffer, v);
        return static_cast<unsigned char>(buffer[0]);
    }
};

struct BenchSplit
{
    static char const* Name() { return "Split"; }
    template <typename Float>
    uint64_t operator()(Float v, int /*precision*/) const {
        return fpround::Split(v).digits;
    }
};

struct BenchFormat
{
    static char const* Name() { return "Format"; }
    uint64_t operator()(double v, int precision) const {
        return fpround::Format(v, precision).size();
    }
};

struct BenchRound
{
    static char const* Name() { return "Round"; }
    template <typename Float>
    uint64_t operator()(Float v, int precision) const {
        return ReinterpretBits<uint64_t>(static_cast<double>(fpround::Round(v, precision)));
    }
};

template <typename Op, typename Float>
static inline void BenchIt(benchmark::State& state, std::vector<Float> const& numbers, int precision)
{
    Op op;

    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        sum += op(numbers[index], precision);
        index = (index + 1) & (NumFloats - 1);
    }

    if (sum == UINT64_MAX)
        abort();
}

template <typename Op, typename Float>
static inline void RegisterOp(char const* name, std::vector<Float> const& numbers, int precision)
{
    const char* float_name = sizeof(Float) == 4 ? "single" : "double";
    auto* bench = benchmark::RegisterBenchmark(
        StrPrintf("%s - %-6s - %s   ", float_name, Op::Name(), name), BenchIt<Op, Float>, numbers, precision);

    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

template <typename Float>
static inline void RegisterShortest(char const* name, std::vector<Float> const& numbers)
{
    RegisterOp<BenchDtoa>(name, numbers, 0);
    RegisterOp<BenchSplit>(name, numbers, 0);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------
static inline void Register_RandomBits_double()
{
    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<uint64_t> gen(1, 0x7FF0000000000000ull - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<double>(gen(rng)); });

    RegisterShortest("Random-bits", numbers);
}

static inline void Register_RandomBits_single()
{
    std::vector<float> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen(1, 0x7F800000u - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<float>(gen(rng)); });

    RegisterShortest("Random-bits", numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------
template <typename Float>
static inline std::vector<Float> GenerateUniform(Float low, Float high)
{
    std::vector<Float> numbers(NumFloats);

    std::uniform_real_distribution<Float> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    return numbers;
}

template <typename Float>
static inline void Register_Uniform(Float low, Float high)
{
    RegisterShortest(StrPrintf("Uniform %.1g/%.1g", low, high), GenerateUniform(low, high));
}

static inline void Register_Precision_double(double low, double high, int precision)
{
    const auto numbers = GenerateUniform(low, high);
    const char* name = StrPrintf("Uniform %.1g/%.1g, p=%d", low, high, precision);

    RegisterOp<BenchFormat>(name, numbers, precision);
    RegisterOp<BenchRound>(name, numbers, precision);
}

static inline void Register_Precision_single(float low, float high, int precision)
{
    const auto numbers = GenerateUniform(low, high);
    const char* name = StrPrintf("Uniform %.1g/%.1g, p=%d", low, high, precision);

    RegisterOp<BenchRound>(name, numbers, precision);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------
int main(int argc, char** argv)
{
    Register_RandomBits_double();
    Register_Uniform(0.0, 1.0);
    Register_Uniform(0.0, 1.0e+15);
    Register_Uniform(1.0e-5, 1.0e+5);

    Register_RandomBits_single();
    Register_Uniform(0.0f, 1.0f);
    Register_Uniform(1.0e-5f, 1.0e+5f);

    Register_Precision_double(0.0, 1.0, 2);
    Register_Precision_double(0.0, 1.0e+6, 2);
    Register_Precision_double(1.0e-5, 1.0e+5, 8);
    Register_Precision_double(0.0, 1.0e+15, 0);

    Register_Precision_single(0.0f, 1.0f, 2);
    Register_Precision_single(1.0e-5f, 1.0e+5f, 4);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
