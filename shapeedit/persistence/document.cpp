#include "shapeedit/persistence/document.h"
#include "shapeedit/core/logging.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <utility>

namespace shapeedit {

std::string buildDocumentJson(const std::vector<ShapeRecord>& records, bool pretty) {
    nlohmann::json doc = nlohmann::json::array();
    for (const ShapeRecord& record : records) {
        doc.push_back(nlohmann::json(record));
    }
    return pretty ? doc.dump(2) : doc.dump();
}

ShapeError parseDocumentJson(std::string_view text, ParsedDocument& out) {
    const nlohmann::json doc = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        SHAPEEDIT_LOG_WARN("document is not valid JSON");
        return ShapeError::ParseError;
    }
    if (!doc.is_array()) {
        SHAPEEDIT_LOG_WARN("document top level is %s, expected array", doc.type_name());
        return ShapeError::ParseError;
    }

    ParsedDocument parsed;
    parsed.records.reserve(doc.size());
    parsed.indices.reserve(doc.size());
    for (std::size_t i = 0; i < doc.size(); ++i) {
        const nlohmann::json& element = doc[i];
        if (!element.is_object()) {
            parsed.skipped.push_back(SkippedRecord{i, ShapeError::ParseError, "record is not an object"});
            continue;
        }
        try {
            parsed.records.push_back(element.get<ShapeRecord>());
            parsed.indices.push_back(i);
        } catch (const nlohmann::json::exception& e) {
            SHAPEEDIT_LOG_WARN("record %zu: %s", i, e.what());
            parsed.skipped.push_back(SkippedRecord{i, ShapeError::ParseError, e.what()});
        }
    }
    out = std::move(parsed);
    return ShapeError::Ok;
}

ShapeError readTextFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        SHAPEEDIT_LOG_WARN("cannot open '%s' for reading", path.c_str());
        return ShapeError::IoError;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        SHAPEEDIT_LOG_WARN("read failed for '%s'", path.c_str());
        return ShapeError::IoError;
    }
    out = buffer.str();
    return ShapeError::Ok;
}

ShapeError writeTextFile(const std::string& path, std::string_view text) {
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        SHAPEEDIT_LOG_WARN("cannot open '%s' for writing", path.c_str());
        return ShapeError::IoError;
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.flush();
    if (!file) {
        SHAPEEDIT_LOG_WARN("write failed for '%s'", path.c_str());
        return ShapeError::IoError;
    }
    return ShapeError::Ok;
}

} // namespace shapeedit
