
#ifndef HELP_H
#define HELP_H

enum helpType { hSyntax, hOptions, hProfile };

void showHelp(enum helpType kind);

#endif

