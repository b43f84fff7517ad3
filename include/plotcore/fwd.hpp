#pragma once

#include <memory>

namespace plotcore
{

template <typename T>
class Shared;

template <typename T>
class AxisRange;
template <typename X, typename Y>
class AxesBounds;
template <typename X, typename Y>
struct Point2;

template <typename X, typename Y>
class AxesModel;
template <typename X, typename Y>
class AxesContext;
template <typename X, typename Y>
class GeometryAxes;
template <typename X, typename Y>
class AxesElements;

template <typename X, typename Y>
class Line;
template <typename X, typename Y>
class Points;
template <typename X, typename Y>
class FunctionCurve;

class GridModel;
class AxesEntry;
class PlotModel;
class FigureModel;
class FigureView;
class RedrawScheduler;
class Painter;
class SvgPainter;
class DrawList;

struct Color;
struct Rect;
struct Vec2;
struct AxisStyle;
struct PlotStyle;
struct DrawStyle;
struct AxesFrame;
struct PlotFrame;
struct FigureFrame;
struct FigureConfig;
struct FigureStyle;

// Shared handle to an axes region, attachable to any number of plots
template <typename X, typename Y>
using SharedAxes = std::shared_ptr<Shared<AxesModel<X, Y>>>;

using SharedFigure = std::shared_ptr<Shared<FigureModel>>;

}   // namespace plotcore
