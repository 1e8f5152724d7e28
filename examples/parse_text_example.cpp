#include <scholar_parser/document_loader.h>
#include <scholar_parser/scholar_parser.h>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <paper.txt|paper.pdf>\n";
        return 1;
    }

    try {
        scholar_parser::DocumentLoader loader;
        scholar_parser::ScholarParser parser;

        auto result = parser.parse(loader.load(argv[1]));

        std::cout << "Title: " << result.title.value_or("(none)") << "\n";
        std::cout << "Abstract: " << result.abstract.value_or("(none)") << "\n\n";

        std::cout << "Sections (" << result.sections.size() << "):\n";
        for (const auto& section : result.sections) {
            std::cout << "  " << section.heading << " - " << section.text.size() << " chars";
            if (section.page_start) {
                std::cout << ", pages " << *section.page_start << "-" << *section.page_end;
            }
            std::cout << "\n";
        }

        std::cout << "\nReferences (" << result.references.size() << "):\n";
        for (const auto& reference : result.references) {
            std::cout << "  " << (reference.year ? std::to_string(*reference.year) : "----")
                      << "  " << reference.doi.value_or("-") << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
