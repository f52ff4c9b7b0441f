#include <rediszset/src.hpp>
