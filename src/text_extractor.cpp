#include "scholar_parser/text_extractor.h"
#include "scholar_parser/errors.h"
#include <mupdf/fitz.h>
#include <iostream>

namespace scholar_parser {

// fz_try is setjmp based. Each fz_try below sits in a function whose frame
// holds only plain pointers and ints, so a MuPDF error never jumps over a
// C++ destructor. Errors become ExtractionError once the frame is left.
class TextExtractor::Impl {
public:
    Impl() {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw ExtractionError("Failed to create MuPDF context");
        }
        if (!register_handlers()) {
            std::string message = fz_caught_message(ctx);
            fz_drop_context(ctx);
            throw ExtractionError("Failed to register MuPDF document handlers: " + message);
        }
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    std::string extract_page(const std::string& pdf_path, int page_number) {
        DocumentHandle doc(ctx, open_document(pdf_path));

        int page_count = count_pages(doc.get());
        if (page_count < 0) {
            throw ExtractionError("MuPDF error counting pages of " + pdf_path + ": " + fz_caught_message(ctx));
        }
        if (page_number < 0 || page_number >= page_count) {
            throw ExtractionError("Page " + std::to_string(page_number) + " out of range for " + pdf_path);
        }
        return page_text(doc.get(), page_number, pdf_path);
    }

    std::vector<std::string> extract_all_pages(const std::string& pdf_path, const ExtractOptions& options) {
        DocumentHandle doc(ctx, open_document(pdf_path));

        int page_count = count_pages(doc.get());
        if (page_count < 0) {
            throw ExtractionError("MuPDF error reading " + pdf_path + ": " + fz_caught_message(ctx));
        }
        if (options.page_limit >= 0 && options.page_limit < page_count) {
            page_count = options.page_limit;
        }
        if (options.verbose) {
            std::cerr << "[TextExtractor::extract_all_pages] " << pdf_path << " has "
                      << page_count << " pages" << std::endl;
        }

        std::vector<std::string> pages;
        pages.reserve(static_cast<size_t>(page_count));
        for (int i = 0; i < page_count; ++i) {
            if (options.verbose && i % 50 == 0) {
                std::cerr << "[TextExtractor::extract_all_pages] Processing page " << i
                          << "/" << page_count << std::endl;
            }
            pages.push_back(page_text(doc.get(), i, pdf_path));
        }
        return pages;
    }

    int get_page_count(const std::string& pdf_path) {
        DocumentHandle doc(ctx, open_document(pdf_path));

        int page_count = count_pages(doc.get());
        if (page_count < 0) {
            throw ExtractionError("MuPDF error getting page count of " + pdf_path + ": " + fz_caught_message(ctx));
        }
        return page_count;
    }

private:
    // Drops the document when the C++ scope ends
    class DocumentHandle {
    public:
        DocumentHandle(fz_context *ctx, fz_document *doc) : ctx_(ctx), doc_(doc) {}
        ~DocumentHandle() { fz_drop_document(ctx_, doc_); }

        DocumentHandle(const DocumentHandle&) = delete;
        DocumentHandle& operator=(const DocumentHandle&) = delete;

        fz_document* get() const { return doc_; }

    private:
        fz_context *ctx_;
        fz_document *doc_;
    };

    bool register_handlers() {
        int failed = 0;
        fz_try(ctx) {
            fz_register_document_handlers(ctx);
        }
        fz_catch(ctx) {
            failed = 1;
        }
        return !failed;
    }

    fz_document* open_document(const std::string& pdf_path) {
        fz_document *doc = try_open(pdf_path.c_str());
        if (!doc) {
            throw ExtractionError("Unable to open PDF: " + pdf_path + ": " + fz_caught_message(ctx));
        }
        return doc;
    }

    // nullptr on failure
    fz_document* try_open(const char *path) {
        fz_document *doc = nullptr;
        fz_var(doc);

        fz_try(ctx) {
            doc = fz_open_document(ctx, path);
        }
        fz_catch(ctx) {
            doc = nullptr;
        }
        return doc;
    }

    // -1 on failure
    int count_pages(fz_document *doc) {
        int page_count = -1;
        fz_var(page_count);

        fz_try(ctx) {
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            page_count = -1;
        }
        return page_count;
    }

    // nullptr on failure; the caller drops the result
    fz_stext_page* load_stext(fz_document *doc, int page_number) {
        fz_page *page = nullptr;
        fz_stext_page *stext = nullptr;
        fz_stext_options opts = { 0 };
        opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;

        fz_var(page);
        fz_var(stext);

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number);
            stext = fz_new_stext_page_from_page(ctx, page, &opts);
        }
        fz_always(ctx) {
            fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            fz_drop_stext_page(ctx, stext);
            stext = nullptr;
        }
        return stext;
    }

    std::string page_text(fz_document *doc, int page_number, const std::string& pdf_path) {
        fz_stext_page *stext = load_stext(doc, page_number);
        if (!stext) {
            throw ExtractionError("MuPDF error extracting page " + std::to_string(page_number) +
                                  " of " + pdf_path + ": " + fz_caught_message(ctx));
        }

        std::string text;
        try {
            text = stext_to_text(stext);
        } catch (const std::exception&) {
            fz_drop_stext_page(ctx, stext);
            throw;
        }
        fz_drop_stext_page(ctx, stext);
        return text;
    }

    // Plain traversal of the stext tree; no MuPDF call here can throw
    static std::string stext_to_text(fz_stext_page *stext) {
        std::string text;

        for (fz_stext_block *block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }
            if (!text.empty()) {
                text += "\n";
            }

            for (fz_stext_line *line = block->u.t.first_line; line; line = line->next) {
                for (fz_stext_char *ch = line->first_char; ch; ch = ch->next) {
                    char utf8[FZ_UTFMAX + 1] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    text.append(utf8, len);
                }
                text += "\n";
            }
        }

        return text;
    }

    fz_context *ctx;
};

TextExtractor::TextExtractor() : pImpl(std::make_unique<Impl>()) {}
TextExtractor::~TextExtractor() = default;

std::string TextExtractor::extract_page(const std::string& pdf_path, int page_number) {
    return pImpl->extract_page(pdf_path, page_number);
}

std::vector<std::string> TextExtractor::extract_all_pages(const std::string& pdf_path,
                                                          const ExtractOptions& options) {
    return pImpl->extract_all_pages(pdf_path, options);
}

int TextExtractor::get_page_count(const std::string& pdf_path) {
    return pImpl->get_page_count(pdf_path);
}

} // namespace scholar_parser
