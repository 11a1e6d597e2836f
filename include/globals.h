
#ifndef GLOBALS_H
#define GLOBALS_H

#include "globalsdef.h"

// presentation state only (color, quiet, debug selectors);  anything that
// changes what gets backed up or restored belongs in RunConfig instead.
extern struct global_vars GLOBALS;

#endif

