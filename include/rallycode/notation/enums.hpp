#pragma once

#include "rallycode/notation/enums/shot_type.hpp"
#include "rallycode/notation/enums/direction.hpp"
#include "rallycode/notation/enums/depth.hpp"
#include "rallycode/notation/enums/fault.hpp"
#include "rallycode/notation/enums/outcome.hpp"
#include "rallycode/notation/enums/position.hpp"
#include "rallycode/notation/enums/shortcut.hpp"
