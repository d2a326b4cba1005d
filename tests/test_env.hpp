#pragma once

// Test-only environment setter used by the HINTC_* configuration tests.
// Tests call the Windows spelling _putenv("NAME=VALUE"); test_env.cpp
// supplies it on POSIX. An empty VALUE removes the variable.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif
