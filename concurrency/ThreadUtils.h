#pragma once

namespace concurrency
{
// Name is truncated to 15 characters by the OS.
void setThreadName(const char* name);
} // namespace concurrency
