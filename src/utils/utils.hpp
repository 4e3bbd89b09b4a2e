#pragma once

#include "logging.hpp"
#include "errors.hpp"
#include "math.hpp"
