#pragma once
/*
 * DebugLog
 *
 * Purpose: opt-in diagnostics for a program that owns the terminal.
 * Usage: export SLATE_DEBUG_LOG=/tmp/slate.log; write via debug_log() << ...;
 * when the variable is unset every write goes to a disabled stream.
 */
#include <ostream>

bool debug_log_enabled();
std::ostream& debug_log();
