#include "tests/test_common.h"
#include "shapeedit/editor.h"

using namespace shapeedit;
using namespace shapeedit_test;

namespace {

void drawRectangle(ShapeEditor& editor, double x0, double y0, double x1, double y1) {
    editor.setActiveTool(Tool::Rectangle);
    editor.pointerDown(x0, y0, PointerButton::Primary);
    editor.pointerUp(x0, y0);
    editor.pointerDown(x1, y1, PointerButton::Primary);
    editor.pointerUp(x1, y1);
}

} // namespace

TEST(ShapeEditorTest, DefaultsComeFromInteractionConstants) {
    ShapeEditor editor;
    EXPECT_DOUBLE_EQ(editor.config().rotationStepDegrees, 15.0);
    EXPECT_DOUBLE_EQ(editor.config().wheelScaleStep, 1.1);
    EXPECT_EQ(editor.config().defaultStyle.strokeWidth, 2);
    EXPECT_EQ(editor.session().pendingStyle(), ShapeStyle{});
    EXPECT_EQ(editor.activeTool(), Tool::None);
}

TEST(ShapeEditorTest, StrokePaletteWidthsAreAllAccepted) {
    ShapeEditor editor;
    const std::vector<int> palette = ShapeEditor::strokeWidthPalette();
    EXPECT_EQ(palette, (std::vector<int>{1, 2, 4, 6, 8, 10}));
    for (int width : palette) {
        EXPECT_EQ(editor.setStrokeWidth(width), ShapeError::Ok);
    }
}

TEST(ShapeEditorTest, SetConfigRejectsInvalidValues) {
    ShapeEditor editor;
    EditorConfig bad;
    bad.wheelScaleStep = 0.0;
    EXPECT_EQ(editor.setConfig(bad), ShapeError::InvalidOperation);
    bad = EditorConfig{};
    bad.defaultStyle.strokeWidth = -1;
    EXPECT_EQ(editor.setConfig(bad), ShapeError::InvalidOperation);
    EXPECT_DOUBLE_EQ(editor.config().wheelScaleStep, 1.1);

    EditorConfig good;
    good.defaultStyle.strokeWidth = 10;
    ASSERT_EQ(editor.setConfig(good), ShapeError::Ok);
    EXPECT_EQ(editor.session().pendingStyle().strokeWidth, 10);
}

TEST(ShapeEditorTest, InvalidInitialConfigFallsBackToDefaults) {
    EditorConfig bad;
    bad.wheelScaleStep = -1.0;
    bad.defaultStyle.strokeWidth = 0;
    ShapeEditor editor(bad);
    EXPECT_DOUBLE_EQ(editor.config().wheelScaleStep, 1.1);
    EXPECT_EQ(editor.config().defaultStyle.strokeWidth, 2);
    EXPECT_EQ(editor.session().pendingStyle().strokeWidth, 2);
}

TEST(ShapeEditorTest, SavedStrokeWidthSurvivesReload) {
    ShapeEditor editor;
    ASSERT_EQ(editor.setStrokeWidth(8), ShapeError::Ok);
    drawRectangle(editor, 0.0, 0.0, 10.0, 10.0);
    ShapeEditor other;
    ASSERT_EQ(other.loadDocument(editor.saveDocument()), ShapeError::Ok);
    ASSERT_EQ(other.shapes().size(), 1u);
    EXPECT_EQ(other.shapes().all()[0].style().strokeWidth, 8);
}

TEST(ShapeEditorTest, HexColorSetters) {
    ShapeEditor editor;
    EXPECT_EQ(editor.setOutlineColorHex("#00FF00"), ShapeError::Ok);
    EXPECT_EQ(editor.setFillColorHex("blue"), ShapeError::InvalidStyle);
    EXPECT_EQ(editor.session().pendingStyle().outline, (Color{0, 255, 0}));
    EXPECT_EQ(editor.session().pendingStyle().fill, kWhite);
}

TEST(ShapeEditorTest, SaveAndLoadDocumentRoundTrip) {
    ShapeEditor editor;
    ASSERT_EQ(editor.setFillColorHex("#336699"), ShapeError::Ok);
    editor.setFillEnabled(true);
    drawRectangle(editor, 40.0, 25.0, 10.0, 20.0);
    ASSERT_EQ(editor.shapeCount(), 1u);

    const std::string json = editor.saveDocument();
    EXPECT_NE(json.find("\"RECTANGLE\""), std::string::npos);
    EXPECT_NE(json.find("#336699"), std::string::npos);

    ShapeEditor other;
    ASSERT_EQ(other.loadDocument(json), ShapeError::Ok);
    EXPECT_EQ(other.lastLoadReport().loaded, 1u);
    EXPECT_EQ(other.shapes().toRecords(), editor.shapes().toRecords());
}

TEST(ShapeEditorTest, FailedLoadKeepsShapesAndReport) {
    ShapeEditor editor;
    drawRectangle(editor, 0.0, 0.0, 10.0, 10.0);
    ASSERT_EQ(editor.loadDocument(editor.saveDocument()), ShapeError::Ok);

    EXPECT_EQ(editor.loadDocument("not json"), ShapeError::ParseError);
    EXPECT_EQ(editor.loadFromFile("/nonexistent-shapeedit-dir/doc.json"), ShapeError::IoError);
    EXPECT_EQ(editor.shapeCount(), 1u);
    EXPECT_EQ(editor.lastLoadReport().loaded, 1u);
}

TEST(ShapeEditorTest, LoadResetsStaging) {
    ShapeEditor editor;
    editor.setActiveTool(Tool::Path);
    editor.pointerDown(0.0, 0.0, PointerButton::Primary);
    ASSERT_EQ(editor.session().stagedPath().size(), 1u);

    ASSERT_EQ(editor.loadDocument("[]"), ShapeError::Ok);
    EXPECT_EQ(editor.activeTool(), Tool::None);
    EXPECT_TRUE(editor.session().stagedPath().empty());
}

TEST(ShapeEditorTest, FileRoundTripHonorsPrettyPrintSetting) {
    ShapeEditor editor;
    EditorConfig compact;
    compact.prettyPrintDocuments = false;
    ASSERT_EQ(editor.setConfig(compact), ShapeError::Ok);
    drawRectangle(editor, 0.0, 0.0, 10.0, 10.0);
    EXPECT_EQ(editor.saveDocument().find('\n'), std::string::npos);

    const std::string path = ::testing::TempDir() + "shapeedit_editor_test.json";
    ASSERT_EQ(editor.saveToFile(path), ShapeError::Ok);
    ShapeEditor other;
    ASSERT_EQ(other.loadFromFile(path), ShapeError::Ok);
    EXPECT_EQ(other.shapeCount(), 1u);
}

TEST(ShapeEditorTest, FrameReflectsSelectionAndClear) {
    ShapeEditor editor;
    drawRectangle(editor, 0.0, 0.0, 10.0, 10.0);
    editor.pointerDown(5.0, 5.0, PointerButton::Primary);
    editor.pointerUp(5.0, 5.0);
    EXPECT_EQ(editor.selectedCount(), 1u);

    const RenderList& frame = editor.buildFrame();
    ASSERT_EQ(frame.size(), 2u);
    EXPECT_EQ(frame.commands()[1].kind, DrawCommandKind::SelectionBounds);
    EXPECT_EQ(editor.frameCommands().size(), 2u);

    editor.handleKey(EditorKey::DeleteSelection);
    EXPECT_EQ(editor.shapeCount(), 0u);

    drawRectangle(editor, 0.0, 0.0, 10.0, 10.0);
    editor.clear();
    EXPECT_EQ(editor.shapeCount(), 0u);
    EXPECT_TRUE(editor.buildFrame().commands().empty());
}
