#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "shapeedit/editor.h"

#ifdef EMSCRIPTEN
using namespace shapeedit;

EMSCRIPTEN_BINDINGS(shapeedit_module) {
    emscripten::enum_<ShapeError>("ShapeError")
        .value("Ok", ShapeError::Ok)
        .value("ParseError", ShapeError::ParseError)
        .value("IoError", ShapeError::IoError)
        .value("InvalidGeometry", ShapeError::InvalidGeometry)
        .value("InvalidStyle", ShapeError::InvalidStyle)
        .value("NotFound", ShapeError::NotFound)
        .value("InvalidOperation", ShapeError::InvalidOperation);

    emscripten::enum_<ShapeKind>("ShapeKind")
        .value("Circle", ShapeKind::Circle)
        .value("Rect", ShapeKind::Rect)
        .value("Path", ShapeKind::Path);

    emscripten::enum_<Tool>("Tool")
        .value("None", Tool::None)
        .value("Circle", Tool::Circle)
        .value("Rectangle", Tool::Rectangle)
        .value("Path", Tool::Path);

    emscripten::enum_<PointerButton>("PointerButton")
        .value("Primary", PointerButton::Primary)
        .value("Secondary", PointerButton::Secondary);

    emscripten::enum_<EditorKey>("EditorKey")
        .value("Cancel", EditorKey::Cancel)
        .value("DeleteSelection", EditorKey::DeleteSelection)
        .value("CommitPath", EditorKey::CommitPath)
        .value("RotateClockwise", EditorKey::RotateClockwise)
        .value("RotateCounterClockwise", EditorKey::RotateCounterClockwise);

    emscripten::enum_<DrawCommandKind>("DrawCommandKind")
        .value("Shape", DrawCommandKind::Shape)
        .value("SelectionBounds", DrawCommandKind::SelectionBounds)
        .value("StagedPath", DrawCommandKind::StagedPath);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<AABB>("AABB")
        .field("minX", &AABB::minX)
        .field("minY", &AABB::minY)
        .field("maxX", &AABB::maxX)
        .field("maxY", &AABB::maxY);

    emscripten::value_object<Color>("Color")
        .field("r", &Color::r)
        .field("g", &Color::g)
        .field("b", &Color::b);

    emscripten::value_object<ShapeStyle>("ShapeStyle")
        .field("outline", &ShapeStyle::outline)
        .field("fill", &ShapeStyle::fill)
        .field("filled", &ShapeStyle::filled)
        .field("strokeWidth", &ShapeStyle::strokeWidth);

    emscripten::value_object<CircleGeom>("CircleGeom")
        .field("cx", &CircleGeom::cx)
        .field("cy", &CircleGeom::cy)
        .field("r", &CircleGeom::r);

    emscripten::value_object<RectGeom>("RectGeom")
        .field("x", &RectGeom::x)
        .field("y", &RectGeom::y)
        .field("w", &RectGeom::w)
        .field("h", &RectGeom::h)
        .field("rot", &RectGeom::rot);

    emscripten::register_vector<Point2>("Point2Vector");

    emscripten::value_object<Geometry>("Geometry")
        .field("kind", &Geometry::kind)
        .field("circle", &Geometry::circle)
        .field("rect", &Geometry::rect)
        .field("path", &Geometry::path);

    emscripten::value_object<DrawCommand>("DrawCommand")
        .field("kind", &DrawCommand::kind)
        .field("geometry", &DrawCommand::geometry)
        .field("style", &DrawCommand::style)
        .field("selected", &DrawCommand::selected)
        .field("bounds", &DrawCommand::bounds)
        .field("vertices", &DrawCommand::vertices)
        .field("strokeWidth", &DrawCommand::strokeWidth);

    emscripten::register_vector<DrawCommand>("DrawCommandVector");
    emscripten::register_vector<int>("IntVector");

    emscripten::class_<ShapeEditor>("ShapeEditor")
        .constructor<>()
        .function("clear", &ShapeEditor::clear)
        .function("pointerDown", &ShapeEditor::pointerDown)
        .function("pointerMove", &ShapeEditor::pointerMove)
        .function("pointerUp", &ShapeEditor::pointerUp)
        .function("handleKey", &ShapeEditor::handleKey)
        .function("handleWheel", &ShapeEditor::handleWheel)
        .function("setActiveTool", &ShapeEditor::setActiveTool)
        .function("getActiveTool", &ShapeEditor::activeTool)
        .function("setOutlineColor", &ShapeEditor::setOutlineColorHex)
        .function("setFillColor", &ShapeEditor::setFillColorHex)
        .function("setStrokeWidth", &ShapeEditor::setStrokeWidth)
        .function("setFillEnabled", &ShapeEditor::setFillEnabled)
        .class_function("getStrokeWidthPalette", &ShapeEditor::strokeWidthPalette)
        .function("saveDocument", &ShapeEditor::saveDocument)
        .function("loadDocument", &ShapeEditor::loadDocument)
        .function("getFrame", &ShapeEditor::frameCommands)
        .function("getShapeCount", &ShapeEditor::shapeCount)
        .function("getSelectedCount", &ShapeEditor::selectedCount);
}
#endif
