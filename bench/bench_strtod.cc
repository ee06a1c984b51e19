#include "benchmark/benchmark.h"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "radix_conv.h"

#define BENCH_RADIX_CONV()          1
#define BENCH_STD_STRTOD()          1
#define BENCH_DOUBLE_CONVERSION()   0

static constexpr int NumFloats = 1 << 14;

#if BENCH_RADIX_CONV()
struct S2DRadixConv
{
    using value_type = double;

    value_type operator()(int radix, std::string const& str) const
    {
        value_type flt = 0;
        const auto res = radix_conv::Strtod(radix, str.data(), str.data() + str.size(), flt);
        assert(res.status != radix_conv::StrtodStatus::invalid);
        static_cast<void>(res);
        return flt;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct S2DStdStrtod
{
    using value_type = double;

    value_type operator()(int radix, std::string const& str) const
    {
        assert(radix == 10);
        static_cast<void>(radix);
        value_type flt = std::strtod(str.c_str(), nullptr);
        return flt;
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
#include "double-conversion/double-conversion.h"
struct S2DDoubleConversion
{
    using value_type = double;

    value_type operator()(int radix, std::string const& str) const
    {
        assert(radix == 10);
        static_cast<void>(radix);
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, int radix, std::vector<std::string> const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(radix, numbers[index]) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(char const* name, int radix, std::vector<std::string> const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(name, BenchIt<Converter>, radix, numbers);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    //bench->Repetitions(3);
    bench->ReportAggregatesOnly();
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

static inline void RegisterUniform_double(char const* name, double min, double max)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        char buf[128];
        char* const end = buf + std::snprintf(buf, 128, "%.17g", gen(rng));
        return std::string(buf, end);
    });

#if BENCH_RADIX_CONV()
    RegisterBenchmarks<S2DRadixConv       >(StrPrintf("%s radix_conv        ", name), 10, numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2DStdStrtod       >(StrPrintf("%s std::strtod       ", name), 10, numbers);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks<S2DDoubleConversion>(StrPrintf("%s double_conversion ", name), 10, numbers);
#endif
}

// Random numerals [digits].[digits]^[exponent] in the given radix.
static inline void RegisterDigits(int radix, int num_digits, int min_exponent, int max_exponent)
{
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::vector<std::string> numbers(NumFloats);

    std::uniform_int_distribution<int> gen_digit(0, radix - 1);
    std::uniform_int_distribution<int> gen_exponent(min_exponent, max_exponent);

    char const marker = radix <= 14 ? 'e' : '^';

    std::generate(numbers.begin(), numbers.end(), [&] {
        std::string str;

        str += kDigits[1 + gen_digit(rng) % (radix - 1)];
        str += '.';
        for (int i = 1; i < num_digits; ++i)
        {
            str += kDigits[gen_digit(rng)];
        }

        int exponent = gen_exponent(rng);
        str += marker;
        if (exponent < 0)
        {
            str += '-';
            exponent = -exponent;
        }

        std::string exponent_digits;
        do
        {
            exponent_digits.insert(exponent_digits.begin(), kDigits[exponent % radix]);
            exponent /= radix;
        } while (exponent != 0);

        return str + exponent_digits;
    });

#if BENCH_RADIX_CONV()
    RegisterBenchmarks<S2DRadixConv>(StrPrintf("radix %2d, %3d digits radix_conv", radix, num_digits), radix, numbers);
#endif
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", 0, 1);
    RegisterUniform_double("warm up", 0, 1);
    RegisterUniform_double("warm up", 0, 1);

    RegisterUniform_double("uniform [0,1/2]", 0.0, 0.5);
    RegisterUniform_double("uniform [1/2,1]", 0.5, 1.0);
    RegisterUniform_double("uniform [0,1]", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]", 1.0, 2.0);
    RegisterUniform_double("uniform [8,2^10]", 8.0, 1ll << 10);
    RegisterUniform_double("uniform [2^10,2^20]", 1ll << 10, 1ll << 20);
    RegisterUniform_double("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max]", 0.0, std::numeric_limits<double>::max());

    RegisterDigits( 2,  53, -1000, 1000);
    RegisterDigits( 3,  34,  -600,  600);
    RegisterDigits( 7,  19,  -350,  350);
    RegisterDigits(10,  17,  -300,  300);
    RegisterDigits(10,  40,  -300,  300);
    RegisterDigits(16,  14,  -250,  250);
    RegisterDigits(36,  11,  -190,  190);
    RegisterDigits(36, 100,  -190,  190);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
