/*
 * Debugging routines.
 *
 * Output goes through a single sink function so the same code can write to
 * a serial port on a board or to a log stream on a host.
 */

#pragma once

#include <stddef.h>

namespace shimmer {
namespace debug {

// Receives each chunk of text to print. Chunks are not line-buffered.
typedef void (*Sink)(const char* text);

// Installs a sink. nullptr discards all output, which is the default.
void setSink(Sink sink);

void print(const char* text);
void printUnsigned(unsigned long value);
void printFloat(float value);

// Prints "- label: value" on a line of its own.
void dumpUnsigned(const char* label, unsigned long value);
void dumpFloat(const char* label, float value);
void dumpString(const char* label, const char* value);

} // namespace debug
} // namespace shimmer
