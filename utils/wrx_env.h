#ifndef WRX_ENV_H
#define WRX_ENV_H

#include "wrx_string.h"

// Reads KEY=VALUE lines into the process environment. Missing files are ignored.
void load_env_file(const wrx_string& filepath);

// Value of an environment variable or the fallback when it is unset
wrx_string env_or(const char* name, const wrx_string& fallback);

#endif // WRX_ENV_H
