//  Macros.hpp
//  IranCal
//
//  Shared limits and exit codes.
//
#ifndef Macros_hpp
#define Macros_hpp

#include <stdio.h>

#define MAXLEN 1024

/* Exit codes passed to myexit() */
#define ERRFileIO   1   /* cannot open, read or write a file */
#define ERRDATAIN   2   /* bad value in an input file */
#define ERRCONSIS   3   /* inconsistent configuration */
#define ERRUSAGE    4   /* bad command line */

void myexit(int flag);
void CheckFile(FILE *fp, const char *s);

#endif /* Macros_hpp */
