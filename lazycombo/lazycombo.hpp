#ifndef LAZYCOMBO_ALL_HPP_
#define LAZYCOMBO_ALL_HPP_

#include "collect.hpp"
#include "combinations.hpp"
#include "count.hpp"
#include "depth_first.hpp"
#include "generate.hpp"
#include "lazy_buffer.hpp"
#include "take.hpp"

#endif
