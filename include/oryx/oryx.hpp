#pragma once

#include <oryx/core/error.hpp>
#include <oryx/core/options.hpp>
#include <oryx/core/types.hpp>
#include <oryx/core/value.hpp>
#include <oryx/frame/dataframe.hpp>
#include <oryx/frame/joined.hpp>
#include <oryx/plan/aggregators.hpp>
#include <oryx/runtime/backend.hpp>
