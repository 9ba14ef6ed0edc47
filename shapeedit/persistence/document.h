#ifndef SHAPEEDIT_DOCUMENT_H
#define SHAPEEDIT_DOCUMENT_H

#include "shapeedit/core/types.h"
#include "shapeedit/persistence/shape_record.h"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace shapeedit {

// A record that was present in a document but could not be used.
struct SkippedRecord {
    std::size_t index;   // position in the document array
    ShapeError error;
    std::string reason;
};

struct LoadReport {
    std::size_t loaded{0};
    std::vector<SkippedRecord> skipped;
};

struct ParsedDocument {
    // Structurally valid records, in document order.
    std::vector<ShapeRecord> records;
    // Source array index of each entry in `records`.
    std::vector<std::size_t> indices;
    // Elements that are not objects or lack/mistype a field.
    std::vector<SkippedRecord> skipped;
};

// Serialize records as a JSON array (2-space indent when `pretty`).
std::string buildDocumentJson(const std::vector<ShapeRecord>& records, bool pretty);

// Returns ParseError when `text` is not JSON or its top level is not an
// array; `out` is untouched in that case. Malformed elements are reported in
// `out.skipped` and do not fail the document.
ShapeError parseDocumentJson(std::string_view text, ParsedDocument& out);

ShapeError readTextFile(const std::string& path, std::string& out);
ShapeError writeTextFile(const std::string& path, std::string_view text);

} // namespace shapeedit

#endif // SHAPEEDIT_DOCUMENT_H
