#pragma once

// Single include for the undo/redo history engine.

#include "undo/history.hpp"
#include "undo/history_config.hpp"
#include "undo/history_entry.hpp"
#include "undo/history_error.hpp"
#include "undo/restorable.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"
