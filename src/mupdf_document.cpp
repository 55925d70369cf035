#include "paper_splitter/mupdf_document.h"
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
#include <filesystem>
#include <stdexcept>
#include <mutex>
#include <vector>
#include <iostream>

namespace paper_splitter {

class MupdfDocument::Impl {
public:
    explicit Impl(const std::string& pdf_path) {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw std::runtime_error("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);

        bool failed = false;
        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            std::string message = fz_caught_message(ctx);
            if (doc) fz_drop_document(ctx, doc);
            fz_drop_context(ctx);
            throw std::runtime_error("Failed to open PDF document " + pdf_path + ": " + message);
        }
    }

    ~Impl() {
        if (doc) fz_drop_document(ctx, doc);
        if (ctx) fz_drop_context(ctx);
    }

    void check_page(int page_number) const {
        if (page_number < 1 || page_number > page_count) {
            throw std::out_of_range("Page number out of range: " + std::to_string(page_number));
        }
    }

    [[noreturn]] void raise(const std::string& what) const {
        throw std::runtime_error(what + ": " + fz_caught_message(ctx));
    }

    std::string metadata_title() {
        std::lock_guard<std::mutex> lock(mutex);

        // The first lookup reports the size needed, terminator included.
        std::vector<char> buffer(256, '\0');
        int needed = lookup_title(buffer);
        if (needed >= static_cast<int>(buffer.size())) {
            buffer.assign(static_cast<size_t>(needed) + 1, '\0');
            needed = lookup_title(buffer);
        }
        if (needed <= 0) {
            return "";
        }
        buffer.back() = '\0';
        return std::string(buffer.data());
    }

    // Returns -1 when the title is absent or unreadable.
    int lookup_title(std::vector<char>& buffer) {
        int needed = -1;
        bool failed = false;
        fz_try(ctx) {
            needed = fz_lookup_metadata(ctx, doc, FZ_META_INFO_TITLE, buffer.data(), static_cast<int>(buffer.size()));
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            std::cerr << "[MupdfDocument::metadata_title] Warning: could not read metadata: "
                      << fz_caught_message(ctx) << std::endl;
            return -1;
        }
        return needed;
    }

    float page_height(int page_number) {
        std::lock_guard<std::mutex> lock(mutex);
        check_page(page_number);

        fz_page *page = nullptr;
        fz_var(page);
        fz_rect bounds = fz_empty_rect;
        bool failed = false;

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number - 1);
            bounds = fz_bound_page(ctx, page);
        }
        fz_always(ctx) {
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            raise("MuPDF error reading bounds of page " + std::to_string(page_number));
        }
        return bounds.y1 - bounds.y0;
    }

    // Returns the text blocks of a page; when `joined` is non-null it also
    // receives the whole page text, blocks separated by newlines.
    std::vector<TextBlock> extract_blocks(int page_number, std::string *joined) {
        std::lock_guard<std::mutex> lock(mutex);
        check_page(page_number);

        fz_page *page = nullptr;
        fz_stext_page *stext = nullptr;
        fz_var(page);
        fz_var(stext);
        fz_rect bounds = fz_empty_rect;
        bool failed = false;

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number - 1);
            bounds = fz_bound_page(ctx, page);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
            stext = fz_new_stext_page_from_page(ctx, page, &opts);
        }
        fz_always(ctx) {
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            raise("MuPDF error during text extraction on page " + std::to_string(page_number));
        }

        std::vector<TextBlock> blocks;
        for (fz_stext_block *block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }

            TextBlock text_block;
            text_block.x0 = block->bbox.x0 - bounds.x0;
            text_block.y0 = block->bbox.y0 - bounds.y0;
            text_block.x1 = block->bbox.x1 - bounds.x0;
            text_block.y1 = block->bbox.y1 - bounds.y0;

            for (fz_stext_line *line = block->u.t.first_line; line; line = line->next) {
                if (line != block->u.t.first_line) {
                    text_block.text += '\n';
                }
                for (fz_stext_char *ch = line->first_char; ch; ch = ch->next) {
                    char utf8[8] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    text_block.text.append(utf8, len);
                }
            }

            if (joined) {
                if (!joined->empty()) {
                    *joined += '\n';
                }
                *joined += text_block.text;
            }
            blocks.push_back(std::move(text_block));
        }

        fz_drop_stext_page(ctx, stext);
        return blocks;
    }

    fz_context *ctx = nullptr;
    fz_document *doc = nullptr;
    int page_count = 0;
    std::mutex mutex;
};

namespace {

class MupdfDocumentWriter : public DocumentWriter {
public:
    explicit MupdfDocumentWriter(std::shared_ptr<MupdfDocument::Impl> source)
        : source_(std::move(source)) {
        std::lock_guard<std::mutex> lock(source_->mutex);
        fz_context *ctx = source_->ctx;

        source_pdf_ = pdf_specifics(ctx, source_->doc);
        if (!source_pdf_) {
            throw std::runtime_error("Source document is not a PDF; pages cannot be copied");
        }

        bool failed = false;
        fz_try(ctx) {
            output_ = pdf_create_document(ctx);
            graft_map_ = pdf_new_graft_map(ctx, output_);
        }
        fz_catch(ctx) {
            failed = true;
        }

        if (failed) {
            std::string message = fz_caught_message(ctx);
            if (output_) pdf_drop_document(ctx, output_);
            throw std::runtime_error("Failed to create output PDF: " + message);
        }
    }

    ~MupdfDocumentWriter() override {
        std::lock_guard<std::mutex> lock(source_->mutex);
        if (graft_map_) pdf_drop_graft_map(source_->ctx, graft_map_);
        if (output_) pdf_drop_document(source_->ctx, output_);
    }

    void append_page(int source_page) override {
        std::lock_guard<std::mutex> lock(source_->mutex);
        source_->check_page(source_page);

        bool failed = false;
        fz_try(source_->ctx) {
            pdf_graft_mapped_page(source_->ctx, graft_map_, -1, source_pdf_, source_page - 1);
        }
        fz_catch(source_->ctx) {
            failed = true;
        }

        if (failed) {
            source_->raise("Failed to copy page " + std::to_string(source_page));
        }
        ++pages_;
    }

    int page_count() const override {
        return pages_;
    }

    void save(const std::string& path) override {
        std::lock_guard<std::mutex> lock(source_->mutex);

        pdf_write_options opts = pdf_default_write_options;
        bool failed = false;
        fz_try(source_->ctx) {
            pdf_save_document(source_->ctx, output_, path.c_str(), &opts);
        }
        fz_catch(source_->ctx) {
            failed = true;
        }

        if (failed) {
            source_->raise("Failed to write " + path);
        }
    }

private:
    std::shared_ptr<MupdfDocument::Impl> source_;
    pdf_document *source_pdf_ = nullptr;
    pdf_document *output_ = nullptr;
    pdf_graft_map *graft_map_ = nullptr;
    int pages_ = 0;
};

} // namespace

MupdfDocument::MupdfDocument(const std::string& pdf_path)
    : path_(pdf_path) {
    if (!std::filesystem::exists(pdf_path)) {
        throw std::runtime_error("PDF file not found: " + pdf_path);
    }
    pImpl = std::make_shared<Impl>(pdf_path);
}

MupdfDocument::~MupdfDocument() = default;

int MupdfDocument::page_count() const {
    return pImpl->page_count;
}

std::string MupdfDocument::metadata_title() const {
    return pImpl->metadata_title();
}

float MupdfDocument::page_height(int page_number) const {
    return pImpl->page_height(page_number);
}

std::vector<TextBlock> MupdfDocument::text_blocks(int page_number) const {
    return pImpl->extract_blocks(page_number, nullptr);
}

std::string MupdfDocument::page_text(int page_number) const {
    std::string text;
    pImpl->extract_blocks(page_number, &text);
    return text;
}

std::unique_ptr<DocumentWriter> MupdfDocument::create_writer() const {
    return std::make_unique<MupdfDocumentWriter>(pImpl);
}

std::unique_ptr<Document> open_pdf_document(const std::string& pdf_path) {
    return std::make_unique<MupdfDocument>(pdf_path);
}

} // namespace paper_splitter
