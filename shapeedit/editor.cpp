#include "shapeedit/editor.h"
#include "shapeedit/core/logging.h"
#include "shapeedit/interaction/interaction_constants.h"

namespace shapeedit {

namespace {

EditorConfig validOrDefault(const EditorConfig& config) {
    if (isValidConfig(config)) return config;
    SHAPEEDIT_LOG_WARN("invalid initial editor config (wheel step %g, stroke %d), using defaults",
                       config.wheelScaleStep, config.defaultStyle.strokeWidth);
    return EditorConfig{};
}

} // namespace

ShapeEditor::ShapeEditor()
    : ShapeEditor(EditorConfig{})
{
}

ShapeEditor::ShapeEditor(const EditorConfig& config)
    : config_(validOrDefault(config)), session_(shapes_, config_)
{
}

ShapeError ShapeEditor::setConfig(const EditorConfig& config) {
    if (!isValidConfig(config)) {
        SHAPEEDIT_LOG_WARN("rejected editor config (wheel step %g, stroke %d)",
                           config.wheelScaleStep, config.defaultStyle.strokeWidth);
        return ShapeError::InvalidOperation;
    }
    config_ = config;
    session_.setConfig(config_);
    return ShapeError::Ok;
}

void ShapeEditor::clear() {
    session_.setActiveTool(Tool::None);
    shapes_.clear();
    frame_.clear();
}

ShapeError ShapeEditor::setOutlineColorHex(const std::string& hex) {
    Color color;
    if (!parseHexColor(hex, color)) return ShapeError::InvalidStyle;
    session_.setOutlineColor(color);
    return ShapeError::Ok;
}

ShapeError ShapeEditor::setFillColorHex(const std::string& hex) {
    Color color;
    if (!parseHexColor(hex, color)) return ShapeError::InvalidStyle;
    session_.setFillColor(color);
    return ShapeError::Ok;
}

std::vector<int> ShapeEditor::strokeWidthPalette() {
    const auto& palette = interaction_constants::STROKE_WIDTH_PALETTE;
    return std::vector<int>(palette.begin(), palette.end());
}

std::string ShapeEditor::saveDocument() const {
    return buildDocumentJson(shapes_.toRecords(), config_.prettyPrintDocuments);
}

ShapeError ShapeEditor::loadDocument(const std::string& json) {
    LoadReport report;
    const ShapeError err = shapes_.loadFromString(json, &report);
    if (err != ShapeError::Ok) return err;
    // Staging and drag refer to the replaced shapes.
    session_.setActiveTool(Tool::None);
    lastLoadReport_ = std::move(report);
    return ShapeError::Ok;
}

ShapeError ShapeEditor::saveToFile(const std::string& path) const {
    return shapes_.saveToFile(path, config_.prettyPrintDocuments);
}

ShapeError ShapeEditor::loadFromFile(const std::string& path) {
    LoadReport report;
    const ShapeError err = shapes_.loadFromFile(path, &report);
    if (err != ShapeError::Ok) return err;
    session_.setActiveTool(Tool::None);
    lastLoadReport_ = std::move(report);
    return ShapeError::Ok;
}

const RenderList& ShapeEditor::buildFrame() {
    frame_.clear();
    renderScene(shapes_, &session_, frame_);
    return frame_;
}

std::vector<DrawCommand> ShapeEditor::frameCommands() {
    return buildFrame().commands();
}

} // namespace shapeedit
