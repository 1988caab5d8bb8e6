#pragma once

/// Convenience umbrella header for the framecheck library.

#include <framecheck/core/column.hpp>
#include <framecheck/core/table.hpp>
#include <framecheck/core/time.hpp>
#include <framecheck/inspect/annotation.hpp>
#include <framecheck/inspect/checked.hpp>
#include <framecheck/inspect/inspector.hpp>
#include <framecheck/inspect/value.hpp>
#include <framecheck/schema/builder.hpp>
#include <framecheck/schema/model.hpp>
#include <framecheck/validate/coerce.hpp>
#include <framecheck/validate/engine.hpp>
#include <framecheck/validate/issue.hpp>
