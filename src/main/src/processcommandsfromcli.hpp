#pragma once

#include "fxtrack-command.hpp"
#include "runmodes.hpp"

namespace fxt {

/// Runs given command, printing its result as json on the output logger.
/// Returns false if the command failed.
bool ProcessCommandFromCLI(const FxTrackCommand &command, settings::RunMode runMode);

}  // namespace fxt
