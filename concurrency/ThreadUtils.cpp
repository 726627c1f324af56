#include "concurrency/ThreadUtils.h"
#include <cstring>
#include <pthread.h>

namespace concurrency
{

void setThreadName(const char* name)
{
    char shortName[16];
    std::strncpy(shortName, name, sizeof(shortName) - 1);
    shortName[sizeof(shortName) - 1] = '\0';
    pthread_setname_np(pthread_self(), shortName);
}

} // namespace concurrency
