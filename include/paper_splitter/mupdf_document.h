#pragma once

#include "paper_splitter/document.h"
#include <string>
#include <memory>

namespace paper_splitter {

// Document backed by MuPDF. Page copies into writers are grafted object by
// object, so output pages keep their original content streams and resources.
class MupdfDocument : public Document {
public:
    explicit MupdfDocument(const std::string& pdf_path);
    ~MupdfDocument() override;

    MupdfDocument(const MupdfDocument&) = delete;
    MupdfDocument& operator=(const MupdfDocument&) = delete;

    int page_count() const override;
    std::string metadata_title() const override;
    float page_height(int page_number) const override;
    std::vector<TextBlock> text_blocks(int page_number) const override;
    std::string page_text(int page_number) const override;
    std::unique_ptr<DocumentWriter> create_writer() const override;

    const std::string& path() const { return path_; }

    class Impl;

private:
    std::string path_;
    std::shared_ptr<Impl> pImpl;
};

// Opens a PDF with the MuPDF backend. Throws std::runtime_error if the file
// does not exist or cannot be parsed.
std::unique_ptr<Document> open_pdf_document(const std::string& pdf_path);

} // namespace paper_splitter
