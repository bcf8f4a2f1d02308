/// @file bench_scan.cpp
/// @brief Performance benchmarks for scanjson.
///
/// Measured operations:
///   - Number validation (is_int / is_float)
///   - Token extraction (scalars, strings with and without escapes)
///   - Escaping and unescaping
///   - Full decode passes (small, medium, large, deeply nested documents)

#include <scanjson/scanjson.hpp>

#include <benchmark/benchmark.h>

#include <string>
#include <string_view>

using namespace scanjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

/// Small JSON object (~60 bytes).
static std::string generate_small_json() {
    return R"({"name":"John","age":30,"active":true,"score":95.5})";
}

/// Medium JSON document (~2KB).
static std::string generate_medium_json() {
    std::string s = R"({
        "users": [)";
    for (int i = 0; i < 20; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"name":"user_)" + std::to_string(i) +
             R"(","email":"user)" + std::to_string(i) +
             R"(@test.com","active":)" + (i % 2 == 0 ? "true" : "false") +
             R"(,"score":)" + std::to_string(50.0 + i * 2.5) + "}";
    }
    s += R"(],"total":20,"page":1,"version":"2.0"})";
    return s;
}

/// Large JSON document (~100KB).
static std::string generate_large_json() {
    std::string s = R"({"data":[)";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) s += ",";
        s += R"({"id":)" + std::to_string(i) +
             R"(,"title":"Item )" + std::to_string(i) +
             R"( with \"quoted\" text\tand a tab")" +
             R"(,"price":)" + std::to_string(9.99 + i * 0.1) +
             R"(,"quantity":)" + std::to_string(i % 100) +
             R"(,"tags":["tag)" + std::to_string(i % 10) +
             R"(","common"],"note":null,"active":)" +
             (i % 3 == 0 ? "false" : "true") + "}";
    }
    s += R"(],"meta":{"total":1000,"generated":true}})";
    return s;
}

/// Deeply nested arrays ending in one scalar.
static std::string generate_deeply_nested(int depth) {
    std::string s(static_cast<size_t>(depth), '[');
    s += "0";
    s.append(static_cast<size_t>(depth), ']');
    return s;
}

/// Counts events so the pass cannot be optimized away.
struct CountingHandler {
    size_t events = 0;
    void on_object_begin() noexcept { ++events; }
    void on_object_end(size_t) noexcept { ++events; }
    void on_array_begin() noexcept { ++events; }
    void on_array_end(size_t) noexcept { ++events; }
    void on_key(std::string_view) noexcept { ++events; }
    void on_value(CellType, std::string_view) noexcept { ++events; }
};

// ═══════════════════════════════════════════════════════════════════════════════
// Number validation
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_IsInt(benchmark::State& state) {
    const std::string_view tokens[] = {"0", "-1234567890", "42", "01", "-"};
    for (auto _ : state) {
        for (auto t : tokens) benchmark::DoNotOptimize(is_int(t));
    }
}
BENCHMARK(BM_IsInt);

static void BM_IsFloat(benchmark::State& state) {
    const std::string_view tokens[] = {"0.5", "-6.02e23", "1E-9", "1.", "3"};
    for (auto _ : state) {
        for (auto t : tokens) benchmark::DoNotOptimize(is_float(t));
    }
}
BENCHMARK(BM_IsFloat);

static void BM_ClassifyScalar(benchmark::State& state) {
    const std::string_view tokens[] = {"123", "1.5e3", "true", "null", "nul"};
    for (auto _ : state) {
        for (auto t : tokens) benchmark::DoNotOptimize(classify_scalar(t));
    }
}
BENCHMARK(BM_ClassifyScalar);

// ═══════════════════════════════════════════════════════════════════════════════
// Extraction
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ExtractToken(benchmark::State& state) {
    const std::string_view doc = "-12345.678e-9   ,";
    FixedBuffer<64> out;
    for (auto _ : state) {
        size_t pos = 0;
        benchmark::DoNotOptimize(extract_token(doc, pos, out, true));
        benchmark::DoNotOptimize(pos);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(doc.size()));
}
BENCHMARK(BM_ExtractToken);

static void BM_ExtractStringPlain(benchmark::State& state) {
    const std::string doc =
        "\"" + std::string(static_cast<size_t>(state.range(0)), 'a') + "\",";
    Reader::token_buffer out;
    for (auto _ : state) {
        size_t pos = 0;
        benchmark::DoNotOptimize(extract_string(doc, pos, out, false));
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(doc.size()));
}
BENCHMARK(BM_ExtractStringPlain)->Arg(16)->Arg(256)->Arg(1000);

static void BM_ExtractStringEscaped(benchmark::State& state) {
    std::string body;
    while (body.size() + 4 < static_cast<size_t>(state.range(0))) {
        body += "ab\\n";
    }
    const std::string doc = "\"" + body + "\",";
    Reader::token_buffer out;
    for (auto _ : state) {
        size_t pos = 0;
        benchmark::DoNotOptimize(extract_string(doc, pos, out, false));
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(doc.size()));
}
BENCHMARK(BM_ExtractStringEscaped)->Arg(16)->Arg(256)->Arg(1000);

// ═══════════════════════════════════════════════════════════════════════════════
// Escaping
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_Escape(benchmark::State& state) {
    const std::string_view text = "path/to \"file\"\n\twith\\backslash";
    FixedBuffer<128> out;
    for (auto _ : state) {
        benchmark::DoNotOptimize(escape(text, out));
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Escape);

static void BM_Unescape(benchmark::State& state) {
    const std::string_view text = R"(path\/to \"file\"\n\twith\\backslash)";
    FixedBuffer<128> out;
    for (auto _ : state) {
        benchmark::DoNotOptimize(unescape(text, out));
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_Unescape);

// ═══════════════════════════════════════════════════════════════════════════════
// Decode passes
// ═══════════════════════════════════════════════════════════════════════════════

static void run_pass(benchmark::State& state, const std::string& input) {
    for (auto _ : state) {
        CountingHandler h;
        auto r = try_read(input, h);
        benchmark::DoNotOptimize(r);
        benchmark::DoNotOptimize(h.events);
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}

static void BM_ReadSmall(benchmark::State& state) {
    run_pass(state, generate_small_json());
}
BENCHMARK(BM_ReadSmall);

static void BM_ReadMedium(benchmark::State& state) {
    run_pass(state, generate_medium_json());
}
BENCHMARK(BM_ReadMedium);

static void BM_ReadLarge(benchmark::State& state) {
    run_pass(state, generate_large_json());
}
BENCHMARK(BM_ReadLarge);

static void BM_ReadDeeplyNested(benchmark::State& state) {
    run_pass(state, generate_deeply_nested(static_cast<int>(state.range(0))));
}
BENCHMARK(BM_ReadDeeplyNested)->Arg(16)->Arg(64)->Arg(128);

static void BM_Validate(benchmark::State& state) {
    const auto input = generate_large_json();
    for (auto _ : state) {
        benchmark::DoNotOptimize(scanjson::validate(input));
    }
    state.SetBytesProcessed(state.iterations() *
                            static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_Validate);
