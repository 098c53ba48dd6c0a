#pragma once

/*
===============================================================================
RepSync - Public API Entry Point
===============================================================================

Everything an application needs to join and mirror a live exercise session
lives in repsync::core. Pull in this header, build a channel from
preset::channel::exercise_session() and drive it with ProtocolHandler::poll().
===============================================================================
*/

#include <repsync/core.hpp>
