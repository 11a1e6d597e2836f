
#include "globals.h"

struct global_vars GLOBALS = { 0, true, false };

