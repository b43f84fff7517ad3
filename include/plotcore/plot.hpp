#pragma once

#include <memory>
#include <plotcore/axes.hpp>
#include <plotcore/context.hpp>
#include <plotcore/errors.hpp>
#include <plotcore/frame.hpp>
#include <plotcore/fwd.hpp>
#include <plotcore/logger.hpp>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace plotcore
{

// Type-erased view of one axes slot inside a plot, so a plot can mix axes
// with different value types.
class AxesEntry
{
   public:
    virtual ~AxesEntry() = default;

    virtual void   clear_elements()      = 0;
    virtual size_t element_count() const = 0;

    // True if this slot renders against the given model object.
    virtual bool uses_model(const void* model) const = 0;

    // Snapshot the model, emit grid, geometry and border into a fresh frame.
    virtual AxesFrame render(const Rect& viewport) = 0;
};

// Geometry attached to one shared axes model. Handed to the add_axes_with
// builder; clear_elements() drops the geometry but leaves the model alone.
template <typename X, typename Y>
class AxesElements final : public AxesEntry
{
   public:
    explicit AxesElements(SharedAxes<X, Y> model) : model_(std::move(model))
    {
        if (!model_)
            throw ConstructionError("cannot attach a null axes model");
    }

    void clear_elements() override { elements_.clear(); }

    size_t element_count() const override { return elements_.size(); }

    bool uses_model(const void* model) const override { return model_.get() == model; }

    // Takes ownership of a copy (or moved value) of the geometry. Styled
    // series without a color get the next palette entry.
    template <typename G>
    std::decay_t<G>& plot(G&& geometry)
    {
        using T = std::decay_t<G>;
        static_assert(std::is_base_of_v<GeometryAxes<X, Y>, T>,
                      "plot() needs a GeometryAxes with matching axis types");
        return attach(std::make_unique<T>(std::forward<G>(geometry)));
    }

    template <typename T, typename... Args>
    T& emplace(Args&&... args)
    {
        static_assert(std::is_base_of_v<GeometryAxes<X, Y>, T>,
                      "emplace() needs a GeometryAxes with matching axis types");
        return attach(std::make_unique<T>(std::forward<Args>(args)...));
    }

    const SharedAxes<X, Y>& model() const { return model_; }

    AxesFrame render(const Rect& viewport) override
    {
        // Read lock only for the copy; streaming below runs unlocked.
        const AxesSnapshot<X, Y> snap = model_->read()->snapshot();

        AxesContext<X, Y> cx(snap, viewport);
        if (snap.style.grid_enabled)
            emit_grid(cx, snap);
        for (auto& element : elements_)
            element->render_axes(cx);
        if (snap.style.border_enabled)
            emit_border(cx, snap.style);

        AxesFrame frame;
        frame.bounds = AxesBounds<double, double>(
            AxisRange<double>(static_cast<double>(snap.bounds.x().min()),
                              static_cast<double>(snap.bounds.x().max())),
            AxisRange<double>(static_cast<double>(snap.bounds.y().min()),
                              static_cast<double>(snap.bounds.y().max())));
        frame.grid      = snap.grid;
        frame.style     = snap.style;
        frame.viewport  = viewport;
        frame.drawables = cx.take_drawables();
        return frame;
    }

   private:
    template <typename T>
    T& attach(std::unique_ptr<T> owned)
    {
        auto& ref = *owned;
        if constexpr (requires(T& t) { t.assign_default_color(Color{}); })
            ref.assign_default_color(palette::cycle(elements_.size()));
        elements_.push_back(std::move(owned));
        return ref;
    }

    static void emit_grid(AxesContext<X, Y>& cx, const AxesSnapshot<X, Y>& snap)
    {
        DrawStyle style;
        style.color      = snap.style.grid_color;
        style.line_width = snap.style.grid_width;

        const auto  lines = snap.grid.generate(snap.bounds);
        const auto& b     = snap.bounds;
        for (X gx : lines.x)
        {
            cx.draw_segment(cx.data_to_screen({gx, b.y().min()}),
                            cx.data_to_screen({gx, b.y().max()}),
                            style);
        }
        for (Y gy : lines.y)
        {
            cx.draw_segment(cx.data_to_screen({b.x().min(), gy}),
                            cx.data_to_screen({b.x().max(), gy}),
                            style);
        }
    }

    static void emit_border(AxesContext<X, Y>& cx, const AxisStyle& axis_style)
    {
        DrawStyle style;
        style.color      = axis_style.border_color;
        style.line_width = axis_style.border_width;

        const Rect& r = cx.viewport();
        const Vec2  tl{r.left(), r.top()};
        const Vec2  tr{r.right(), r.top()};
        const Vec2  br{r.right(), r.bottom()};
        const Vec2  bl{r.left(), r.bottom()};
        cx.draw_segment(tl, tr, style);
        cx.draw_segment(tr, br, style);
        cx.draw_segment(br, bl, style);
        cx.draw_segment(bl, tl, style);
    }

    SharedAxes<X, Y>                                 model_;
    std::vector<std::unique_ptr<GeometryAxes<X, Y>>> elements_;
};

// A named collection of axes regions plus the geometry drawn against them.
// Axes models are attached by shared reference; the same model may back
// slots in several plots.
class PlotModel
{
   public:
    PlotModel() = default;
    explicit PlotModel(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    void               name(const std::string& n) { name_ = n; }

    template <typename X, typename Y, typename Builder>
    AxesElements<X, Y>& add_axes_with(SharedAxes<X, Y> model, Builder&& builder)
    {
        auto  entry = std::make_unique<AxesElements<X, Y>>(std::move(model));
        auto& ref   = *entry;
        std::forward<Builder>(builder)(ref);
        axes_.push_back(std::move(entry));
        PLOTCORE_LOG_DEBUG("figure",
                           "Plot '{}' attached axes #{} with {} elements",
                           name_,
                           axes_.size() - 1,
                           ref.element_count());
        return ref;
    }

    template <typename X, typename Y>
    AxesElements<X, Y>& add_axes(SharedAxes<X, Y> model)
    {
        return add_axes_with(std::move(model), [](AxesElements<X, Y>&) {});
    }

    size_t axes_count() const { return axes_.size(); }
    void   clear_axes() { axes_.clear(); }

    const std::vector<std::unique_ptr<AxesEntry>>& axes() const { return axes_; }

    // viewports[i] is the destination for axes_[i]; missing entries render
    // into an empty rect.
    PlotFrame render(std::span<const Rect> viewports);

   private:
    std::string                             name_;
    std::vector<std::unique_ptr<AxesEntry>> axes_;
};

}   // namespace plotcore
