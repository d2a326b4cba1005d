// POSIX _putenv for the configuration tests: NAME=VALUE sets, NAME= unsets.

#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
extern "C" int _putenv(const char* assignment)
{
    if (!assignment) return -1;
    const char* eq = std::strchr(assignment, '=');
    if (!eq) return -1;
    std::string name(assignment, static_cast<size_t>(eq - assignment));
    const char* value = eq + 1;
    if (!*value) return ::unsetenv(name.c_str());
    return ::setenv(name.c_str(), value, 1);
}
#endif
