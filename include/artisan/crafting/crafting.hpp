/// @file crafting.hpp
/// @brief Main include header for artisan_crafting

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "rarity.hpp"
#include "item_key.hpp"
#include "pricing.hpp"
#include "cost.hpp"
#include "availability.hpp"
#include "market.hpp"
#include "batch.hpp"
#include "snapshot.hpp"
