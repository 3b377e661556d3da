//  funPlatform.cpp
//  IranCal
//
#include "funPlatform.hpp"
#include "Macros.hpp"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>

void myexit(int flag)
{
    fflush(stdout);
    fprintf(stderr, "\n  Exit with code %d.\n", flag);
    exit(flag);
}

void CheckFile(FILE *fp, const char *s)
{
    if (fp == NULL) {
        fprintf(stderr, "\n  Fatal Error: Failed to open file.\n");
        fprintf(stderr, "  File: %s\n", s);
        myexit(ERRFileIO);
    }
}

/* Create every missing directory along path. Returns 0 on success. */
int mkdir_p(const char *path, unsigned int mode)
{
    if (path == NULL || path[0] == '\0') {
        return -1;
    }
    char buf[MAXLEN];
    strncpy(buf, path, MAXLEN - 1);
    buf[MAXLEN - 1] = '\0';

    for (char *p = buf + 1; *p != '\0'; p++) {
        if (*p != '/') {
            continue;
        }
        *p = '\0';
        if (mkdir(buf, (mode_t)mode) != 0 && errno != EEXIST) {
            return -1;
        }
        *p = '/';
    }
    if (mkdir(buf, (mode_t)mode) != 0 && errno != EEXIST) {
        return -1;
    }
    return 0;
}
