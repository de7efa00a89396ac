#pragma once

#include <tokparse/alt.hpp>
#include <tokparse/context.hpp>
#include <tokparse/delimited.hpp>
#include <tokparse/leaf.hpp>
#include <tokparse/many.hpp>
#include <tokparse/map.hpp>
#include <tokparse/opt.hpp>
#include <tokparse/separated_list.hpp>
#include <tokparse/tuple.hpp>
