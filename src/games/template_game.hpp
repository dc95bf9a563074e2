// =============================================================================
// Tapdeck - Template game
// =============================================================================
// Reference action table: copy this pair of files to start a new game.
// Config identifiers:
//   functions: doHelloWorld, doExampleTask, doCollectRewards
//   commands : example_command
// =============================================================================
#pragma once

#include "action_registry.hpp"

namespace tapdeck::games {

ActionRegistry templateGame();

} // namespace tapdeck::games
