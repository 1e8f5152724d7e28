#include <benchmark/benchmark.h>
#include <scholar_parser/json_serializer.h>
#include <scholar_parser/scholar_parser.h>
#include <string>
#include <vector>

namespace {

// Synthetic paper: front matter, the usual sections and a bibliography
std::vector<std::string> generate_pages(int num_pages) {
    const char* headings[] = {"Introduction", "Related Work", "Methods", "Results", "Discussion"};

    std::vector<std::string> pages;
    pages.push_back("A Synthetic Study of Document Segmentation\nJ. Doe, R. Roe\n"
                    "Abstract\nWe present a synthetic benchmark document.\n");

    for (int i = 0; i < num_pages; ++i) {
        std::string page = std::string(headings[i % 5]) + "\n";
        for (int k = 0; k < 40; ++k) {
            page += "This is line " + std::to_string(k) + " of page " + std::to_string(i) +
                    ", written to resemble   extracted   body text.\n";
        }
        pages.push_back(page);
    }

    std::string bibliography = "References\n";
    for (int r = 0; r < 80; ++r) {
        bibliography += "[" + std::to_string(r + 1) + "] Author, A. (20" + std::to_string(10 + r % 10) +
                        "). A cited work. doi:10.1234/bench." + std::to_string(r) + "\n";
    }
    pages.push_back(bibliography);

    return pages;
}

} // namespace

static void BM_ParseDocument(benchmark::State& state) {
    auto pages = generate_pages(static_cast<int>(state.range(0)));
    scholar_parser::ScholarParser parser;

    for (auto _ : state) {
        auto result = parser.parse(pages);
        benchmark::DoNotOptimize(result);
    }

    state.counters["pages"] = static_cast<double>(pages.size());
}
BENCHMARK(BM_ParseDocument)->Range(1, 256);

static void BM_SerializeResult(benchmark::State& state) {
    scholar_parser::ScholarParser parser;
    auto result = parser.parse(generate_pages(32));
    bool compact = state.range(0) != 0;

    for (auto _ : state) {
        auto json = compact ? scholar_parser::JsonSerializer::serialize_compact(result)
                            : scholar_parser::JsonSerializer::serialize(result, false);
        benchmark::DoNotOptimize(json);
    }
}
BENCHMARK(BM_SerializeResult)->Arg(0)->Arg(1);

BENCHMARK_MAIN();
