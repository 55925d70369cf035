#pragma once

#include <string>
#include <vector>
#include <memory>

namespace paper_splitter {

// A run of text on a page. Coordinates are in points with y growing
// downward from the top edge of the page.
struct TextBlock {
    float x0 = 0;
    float y0 = 0;
    float x1 = 0;
    float y1 = 0;
    std::string text;
};

// Receives pages copied out of a source Document and writes them as a new file.
class DocumentWriter {
public:
    virtual ~DocumentWriter() = default;

    // Copies 1-indexed page `source_page` of the source document to the end
    // of the output. Throws std::runtime_error if the page cannot be copied.
    virtual void append_page(int source_page) = 0;

    virtual int page_count() const = 0;

    // Throws std::runtime_error if the file cannot be written.
    virtual void save(const std::string& path) = 0;
};

// Read-only paginated document. Pages are 1-indexed. Implementations must
// tolerate concurrent calls from several threads.
class Document {
public:
    virtual ~Document() = default;

    virtual int page_count() const = 0;

    // Title from the document metadata, empty if none.
    virtual std::string metadata_title() const = 0;

    virtual float page_height(int page_number) const = 0;

    virtual std::vector<TextBlock> text_blocks(int page_number) const = 0;

    virtual std::string page_text(int page_number) const = 0;

    virtual std::unique_ptr<DocumentWriter> create_writer() const = 0;
};

} // namespace paper_splitter
