#include <scholar_parser/batch_parser.h>
#include <scholar_parser/config_loader.h>
#include <scholar_parser/detail_extractor.h>
#include <scholar_parser/json_serializer.h>
#include <getopt.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace scholar_parser;

struct CLIOptions {
    std::string input_path;
    std::string output_path;
    std::string config_file;
    std::optional<size_t> max_references;
    std::optional<size_t> tail_window;
    std::optional<size_t> min_reference_length;
    std::optional<size_t> abstract_lines;
    size_t thread_count = 0;  // 0 = auto
    bool details = false;
    std::vector<std::string> detail_sections;
    bool jsonl = false;
    bool verbose = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n";
    std::cout << "\nRequired:\n";
    std::cout << "  -i, --input PATH             Input file (.pdf or text) or directory\n";
    std::cout << "\nOptional:\n";
    std::cout << "  -o, --output PATH            Output file (single input, default: stdout)\n";
    std::cout << "                               or directory (directory input, default: ./out)\n";
    std::cout << "  -c, --config FILE            JSON file with parse options\n";
    std::cout << "  --max-references N          Candidate reference lines to parse (default: 60)\n";
    std::cout << "  --tail-window N              Fallback bibliography window in lines (default: 120)\n";
    std::cout << "  --min-reference-length N     Shortest accepted reference line (default: 30)\n";
    std::cout << "  --abstract-lines N           Lines in the abstract window (default: 5)\n";
    std::cout << "  --threads N                  Worker threads for directories (default: auto-detect)\n";
    std::cout << "  --details[=SECTIONS]         Add claims, methods, limitations, datasets and metrics;\n";
    std::cout << "                               SECTIONS is a comma-separated heading filter\n";
    std::cout << "  --jsonl                      One compact JSON document per line\n";
    std::cout << "  -v, --verbose                Verbose output\n";
    std::cout << "  -q, --quiet                  Quiet mode (errors only)\n";
    std::cout << "  -h, --help                   Show this help message\n";
    std::cout << "  --version                    Show version information\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -i paper.pdf\n";
    std::cout << "  " << program_name << " -i paper.txt -o paper.json --details=methods,results\n";
    std::cout << "  " << program_name << " --input papers/ --output parsed/ --threads 4\n";
}

void print_version() {
    std::cout << "scholar_parse version " << kParserVersion << "\n";
    std::cout << "Built with C++17, MuPDF, nlohmann/json and RapidJSON\n";
}

size_t parse_count(const char* value, const char* name) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a number");
    }
    if (consumed != std::string(value).size()) {
        throw std::invalid_argument(std::string(name) + " must be a number");
    }
    if (parsed < 0) {
        throw std::invalid_argument(std::string(name) + " cannot be negative");
    }
    return static_cast<size_t>(parsed);
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;

    const char* short_opts = "i:o:c:vqh";
    const struct option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"max-references", required_argument, nullptr, 1001},
        {"tail-window", required_argument, nullptr, 1002},
        {"min-reference-length", required_argument, nullptr, 1003},
        {"abstract-lines", required_argument, nullptr, 1004},
        {"threads", required_argument, nullptr, 1005},
        {"details", optional_argument, nullptr, 1006},
        {"jsonl", no_argument, nullptr, 1007},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1008},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'i':
                options.input_path = optarg;
                break;
            case 'o':
                options.output_path = optarg;
                break;
            case 'c':
                options.config_file = optarg;
                break;
            case 1001:
                options.max_references = parse_count(optarg, "max-references");
                break;
            case 1002:
                options.tail_window = parse_count(optarg, "tail-window");
                break;
            case 1003:
                options.min_reference_length = parse_count(optarg, "min-reference-length");
                break;
            case 1004:
                options.abstract_lines = parse_count(optarg, "abstract-lines");
                if (*options.abstract_lines == 0) {
                    throw std::invalid_argument("abstract-lines must be positive");
                }
                break;
            case 1005:
                options.thread_count = parse_count(optarg, "threads");
                break;
            case 1006:
                options.details = true;
                if (optarg) {
                    options.detail_sections = split_list(optarg);
                }
                break;
            case 1007:
                options.jsonl = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1008:
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (options.input_path.empty()) {
        throw std::invalid_argument("Input path is required");
    }

    if (options.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

ParseOptions build_parse_options(const CLIOptions& cli) {
    ParseOptions options = cli.config_file.empty() ? ParseOptions{} : ConfigLoader::load(cli.config_file);

    if (cli.max_references) options.max_reference_lines = *cli.max_references;
    if (cli.tail_window) options.reference_tail_window = *cli.tail_window;
    if (cli.min_reference_length) options.min_reference_length = *cli.min_reference_length;
    if (cli.abstract_lines) options.abstract_window_lines = *cli.abstract_lines;

    validate_options(options);
    return options;
}

std::string render(const ParseResult& result, const CLIOptions& cli) {
    if (!cli.details) {
        return cli.jsonl ? JsonSerializer::serialize_compact(result) : JsonSerializer::serialize(result);
    }

    DetailRequest request;
    request.sections = cli.detail_sections;

    nlohmann::json output = JsonSerializer::to_json(result);
    output["details"] = JsonSerializer::to_json(DetailExtractor{}.extract(result, request));
    return JsonSerializer::dump(output, !cli.jsonl);
}

void write_output(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write output file: " + path);
    }
    out << content << "\n";
}

int process_single_file(const CLIOptions& cli, BatchParser& batch) {
    ParseResult result;
    try {
        result = batch.parse_file(cli.input_path);
    } catch (const ParseError& e) {
        std::cerr << "Error processing " << cli.input_path << ": " << e.what() << std::endl;
        return 1;
    }

    std::string content = render(result, cli);
    if (cli.output_path.empty() || cli.output_path == "-") {
        std::cout << content << std::endl;
    } else {
        write_output(cli.output_path, content);
        if (!cli.quiet) {
            std::cerr << "Saved " << result.sections.size() << " sections and "
                      << result.references.size() << " references to " << cli.output_path << std::endl;
        }
    }
    return 0;
}

int process_directory(const CLIOptions& cli, BatchParser& batch) {
    auto inputs = DocumentLoader::collect_inputs(cli.input_path);
    if (inputs.empty()) {
        std::cerr << "No .pdf or .txt files found in " << cli.input_path << std::endl;
        return 1;
    }
    if (!cli.quiet) {
        std::cerr << "Found " << inputs.size() << " files to process" << std::endl;
    }

    auto items = batch.parse_files(inputs, [&cli](size_t current, size_t total) {
        if (!cli.quiet) {
            std::cerr << "\rProgress: " << current << "/" << total
                      << " (" << (100 * current / total) << "%)" << std::flush;
        }
    });
    if (!cli.quiet) {
        std::cerr << std::endl;
    }

    std::string output_dir = cli.output_path.empty() ? "./out" : cli.output_path;
    fs::create_directories(output_dir);

    std::ofstream jsonl_out;
    if (cli.jsonl) {
        auto jsonl_path = (fs::path(output_dir) / "results.jsonl").string();
        jsonl_out.open(jsonl_path);
        if (!jsonl_out) {
            throw std::runtime_error("Cannot write output file: " + jsonl_path);
        }
    }

    size_t failures = 0;
    for (const auto& item : items) {
        if (!item.success()) {
            std::cerr << "Error processing " << item.path << ": " << item.error << std::endl;
            ++failures;
            continue;
        }

        try {
            std::string content = render(*item.result, cli);
            if (cli.jsonl) {
                jsonl_out << content << "\n";
            } else {
                auto output_path = fs::path(DocumentLoader::output_path_for(cli.input_path, item.path, output_dir));
                fs::create_directories(output_path.parent_path());
                write_output(output_path.string(), content);
            }
        } catch (const std::exception& e) {
            std::cerr << "Error writing result for " << item.path << ": " << e.what() << std::endl;
            ++failures;
        }
    }

    if (!cli.quiet) {
        auto stats = batch.get_stats();
        std::cerr << "\n=== Processing Complete ===\n";
        std::cerr << "Successfully processed: " << (items.size() - failures) << "/" << items.size() << " files\n";
        std::cerr << "Pages processed: " << stats["pages_processed"] << "\n";
        std::cerr << "Total time: " << stats["total_processing_time_ms"] << " ms" << std::endl;
    }

    return failures == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) {
    CLIOptions cli;
    ParseOptions parse_options;

    try {
        cli = parse_arguments(argc, argv);
        if (cli.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (cli.version) {
            print_version();
            return 0;
        }
        parse_options = build_parse_options(cli);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!fs::exists(cli.input_path)) {
        std::cerr << "Error: Input path does not exist: " << cli.input_path << std::endl;
        return 1;
    }

    if (cli.verbose) {
        std::cerr << "[main] Parse options: " << ConfigLoader::to_json(parse_options).dump() << std::endl;
    }

    try {
        BatchOptions batch_options;
        batch_options.thread_count = cli.thread_count;
        batch_options.verbose = cli.verbose;
        BatchParser batch(parse_options, batch_options);

        if (fs::is_directory(cli.input_path)) {
            return process_directory(cli, batch);
        }
        return process_single_file(cli, batch);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
