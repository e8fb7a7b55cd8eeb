/*
 * Debugging routines.
 */

#include "debug.h"

#include <stdio.h>

namespace shimmer {
namespace debug {
namespace {

Sink sink = nullptr;

} // namespace

void setSink(Sink newSink)
{
    sink = newSink;
}

void print(const char* text)
{
    if (sink) sink(text);
}

void printUnsigned(unsigned long value)
{
    char buf[24];
    snprintf(buf, sizeof buf, "%lu", value);
    print(buf);
}

void printFloat(float value)
{
    char buf[32];
    snprintf(buf, sizeof buf, "%.3f", double(value));
    print(buf);
}

void dumpUnsigned(const char* label, unsigned long value)
{
    print("- ");
    print(label);
    print(": ");
    printUnsigned(value);
    print("\r\n");
}

void dumpFloat(const char* label, float value)
{
    print("- ");
    print(label);
    print(": ");
    printFloat(value);
    print("\r\n");
}

void dumpString(const char* label, const char* value)
{
    print("- ");
    print(label);
    print(": ");
    print(value);
    print("\r\n");
}

} // namespace debug
} // namespace shimmer
