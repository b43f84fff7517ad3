#pragma once

// Umbrella header

#include <plotcore/axes.hpp>
#include <plotcore/color.hpp>
#include <plotcore/context.hpp>
#include <plotcore/errors.hpp>
#include <plotcore/export.hpp>
#include <plotcore/figure.hpp>
#include <plotcore/frame.hpp>
#include <plotcore/fwd.hpp>
#include <plotcore/geometry.hpp>
#include <plotcore/grid.hpp>
#include <plotcore/logger.hpp>
#include <plotcore/painter.hpp>
#include <plotcore/plot.hpp>
#include <plotcore/plot_style.hpp>
#include <plotcore/scheduler.hpp>
#include <plotcore/series.hpp>
#include <plotcore/shared.hpp>
#include <plotcore/transform.hpp>
#include <plotcore/view.hpp>
