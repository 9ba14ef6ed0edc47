#include "shapeedit/entity/shape_collection.h"
#include "shapeedit/core/logging.h"
#include <algorithm>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <utility>

namespace shapeedit {

std::uint32_t ShapeCollection::insert(ShapeError geometryStatus, Geometry geometry, const ShapeStyle& style) {
    if (geometryStatus != ShapeError::Ok) {
        lastError_ = geometryStatus;
        return 0;
    }
    if (!isValidStrokeWidth(style.strokeWidth)) {
        SHAPEEDIT_LOG_WARN("rejected shape with stroke width %d", style.strokeWidth);
        lastError_ = ShapeError::InvalidStyle;
        return 0;
    }
    const std::uint32_t id = nextId_++;
    shapes_.emplace_back(id, std::move(geometry), style);
    lastError_ = ShapeError::Ok;
    SHAPEEDIT_LOG_DEBUG("added shape %u (kind %u)", id, static_cast<unsigned>(shapes_.back().kind()));
    return id;
}

std::uint32_t ShapeCollection::addCircle(double cx, double cy, double r, const ShapeStyle& style) {
    Geometry geometry;
    const ShapeError err = makeCircle(cx, cy, r, geometry);
    return insert(err, std::move(geometry), style);
}

std::uint32_t ShapeCollection::addRectangle(double x, double y, double w, double h, const ShapeStyle& style) {
    Geometry geometry;
    const ShapeError err = makeRect(x, y, w, h, geometry);
    return insert(err, std::move(geometry), style);
}

std::uint32_t ShapeCollection::addPath(const std::vector<Point2>& vertices, const ShapeStyle& style) {
    Geometry geometry;
    const ShapeError err = makePath(vertices, geometry);
    return insert(err, std::move(geometry), style);
}

std::size_t ShapeCollection::deleteSelected() {
    const auto first = std::stable_partition(shapes_.begin(), shapes_.end(),
        [](const ShapeEntity& shape) { return !shape.isSelected(); });
    const std::size_t removed = static_cast<std::size_t>(std::distance(first, shapes_.end()));
    shapes_.erase(first, shapes_.end());
    return removed;
}

void ShapeCollection::deselectAll() {
    for (ShapeEntity& shape : shapes_) {
        shape.setSelected(false);
    }
}

void ShapeCollection::clear() {
    shapes_.clear();
    nextId_ = 1;
}

ShapeError ShapeCollection::select(std::uint32_t id) {
    ShapeEntity* shape = find(id);
    if (!shape) return ShapeError::NotFound;
    shape->setSelected(true);
    return ShapeError::Ok;
}

std::size_t ShapeCollection::selectedCount() const {
    return static_cast<std::size_t>(std::count_if(shapes_.begin(), shapes_.end(),
        [](const ShapeEntity& shape) { return shape.isSelected(); }));
}

ShapeEntity* ShapeCollection::find(std::uint32_t id) {
    for (ShapeEntity& shape : shapes_) {
        if (shape.id() == id) return &shape;
    }
    return nullptr;
}

const ShapeEntity* ShapeCollection::find(std::uint32_t id) const {
    for (const ShapeEntity& shape : shapes_) {
        if (shape.id() == id) return &shape;
    }
    return nullptr;
}

std::vector<ShapeRecord> ShapeCollection::toRecords() const {
    std::vector<ShapeRecord> records;
    records.reserve(shapes_.size());
    for (const ShapeEntity& shape : shapes_) {
        records.push_back(shape.toRecord());
    }
    return records;
}

ShapeError ShapeCollection::saveToString(std::string& out, bool pretty) const {
    out = buildDocumentJson(toRecords(), pretty);
    lastError_ = ShapeError::Ok;
    return ShapeError::Ok;
}

ShapeError ShapeCollection::saveTo(std::ostream& out, bool pretty) const {
    out << buildDocumentJson(toRecords(), pretty);
    out.flush();
    if (!out) {
        SHAPEEDIT_LOG_WARN("save stream failed after %zu shapes", shapes_.size());
        lastError_ = ShapeError::IoError;
        return lastError_;
    }
    lastError_ = ShapeError::Ok;
    return ShapeError::Ok;
}

ShapeError ShapeCollection::loadFromString(std::string_view text, LoadReport* report) {
    ParsedDocument parsed;
    const ShapeError docErr = parseDocumentJson(text, parsed);
    if (docErr != ShapeError::Ok) {
        lastError_ = docErr;
        return docErr;
    }

    LoadReport localReport;
    localReport.skipped = std::move(parsed.skipped);

    std::vector<ShapeEntity> scratch;
    scratch.reserve(parsed.records.size());
    std::uint32_t nextId = 1;
    for (std::size_t i = 0; i < parsed.records.size(); ++i) {
        ShapeEntity entity;
        const ShapeError err = ShapeEntity::fromRecord(parsed.records[i], nextId, entity);
        if (err != ShapeError::Ok) {
            localReport.skipped.push_back(SkippedRecord{parsed.indices[i], err,
                "cannot decode " + parsed.records[i].type + " record"});
            continue;
        }
        scratch.push_back(std::move(entity));
        ++nextId;
    }
    std::sort(localReport.skipped.begin(), localReport.skipped.end(),
        [](const SkippedRecord& a, const SkippedRecord& b) { return a.index < b.index; });
    localReport.loaded = scratch.size();

    shapes_.swap(scratch);
    nextId_ = nextId;
    lastError_ = ShapeError::Ok;
    SHAPEEDIT_LOG_DEBUG("loaded %zu shapes, skipped %zu records", localReport.loaded, localReport.skipped.size());
    if (report) *report = std::move(localReport);
    return ShapeError::Ok;
}

ShapeError ShapeCollection::loadFrom(std::istream& in, LoadReport* report) {
    if (!in) {
        SHAPEEDIT_LOG_WARN("load stream is not readable");
        lastError_ = ShapeError::IoError;
        return lastError_;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        SHAPEEDIT_LOG_WARN("load stream failed");
        lastError_ = ShapeError::IoError;
        return lastError_;
    }
    return loadFromString(buffer.str(), report);
}

ShapeError ShapeCollection::saveToFile(const std::string& path, bool pretty) const {
    lastError_ = writeTextFile(path, buildDocumentJson(toRecords(), pretty));
    return lastError_;
}

ShapeError ShapeCollection::loadFromFile(const std::string& path, LoadReport* report) {
    std::string text;
    const ShapeError err = readTextFile(path, text);
    if (err != ShapeError::Ok) {
        lastError_ = err;
        return err;
    }
    return loadFromString(text, report);
}

} // namespace shapeedit
