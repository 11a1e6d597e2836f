#ifndef DEBUG_H
#define DEBUG_H

/*
 Borrowed from Philip Hazel's Exim Mail Transport Agent
 */


#include <sys/types.h>

typedef unsigned char uschar;
#define US   (unsigned char *)
#define CUSS (const unsigned char **)
#define CS   (char *)
#define CCS   (const char *)
#define Uskip_whitespace(sp) skip_whitespace(CUSS sp)
#define Ustrncmp(s,t,n)    strncmp(CCS(s),CCS(t),n)
#define nelem(arr) (sizeof(arr) / sizeof(*arr))

/* Assume words are 32 bits wide. */
#define BITWORDSIZE 32

/* Single-word bit vectors: the debug selector. */
#define BIT(n) (1UL << (n))

/* Multi-word vectors. */
#define BITWORD(n) (      (n) / BITWORDSIZE)
#define BITMASK(n) (1U << (n) % BITWORDSIZE)

#define BIT_CLEAR(s,z,n) ((s)[BITWORD(n)] &= ~BITMASK(n))
#define BIT_SET(s,z,n)   ((s)[BITWORD(n)] |=  BITMASK(n))
#define BIT_TEST(s,z,n) (((s)[BITWORD(n)] &   BITMASK(n)) != 0)

#define BIT_TABLE(T,name) { US #name, T##i_##name }

/* IOTA keeps an implicit sequential count, like a simple enum, so that each
DEBUG_BIT() line below declares both a bit index and its mask. */

#define IOTA(iota)      (__LINE__ - iota)
#define IOTA_INIT(zero) (__LINE__ - zero + 1)

/* Di_all is a special value recognized by decode_bits(). These must match
the debug_options table in debug.cc, which is kept in alphabetical order. */

#define DEBUG_BIT(name) Di_##name = IOTA(Di_iota), D_##name = (int)BIT(Di_##name)

enum {
  Di_all        = -1,
  Di_v          = 0,

  Di_iota = IOTA_INIT(1),
  DEBUG_BIT(commit),
  DEBUG_BIT(config),
  DEBUG_BIT(db),
  DEBUG_BIT(exec),
  DEBUG_BIT(mirror),
  DEBUG_BIT(repo),
  DEBUG_BIT(restore),
  DEBUG_BIT(stage),
};

#define D_all                        0xffffffff

#define D_any                        (D_all)

#define D_default                    (D_all & \
                                       ~(D_config           | \
                                         D_exec             | \
                                         D_stage))


#define DEBUG(x)      if (GLOBALS.debugSelector & (x))

typedef struct bit_table {
  uschar *name;
  int bit;
} bit_table;


extern bit_table debug_options[];
extern int debug_notall[];
extern int ndebug_options;


void decode_bits(unsigned int *selector, size_t selsize, int *notall,
  uschar *parsestring, bit_table *options, int count);


#endif
