#pragma once

// includes box and vector as well
#include <hyprutils/math/Box.hpp>

// NOLINTNEXTLINE
using namespace Hyprutils::Math;
