//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptCommonImpl_H
#define ptCommonImpl_H

#include <cstdlib>
#include <cstring>
#include <cassert>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cinttypes>
#include <cfloat>
#include <cmath>
#include <algorithm>  // std::min,std::max
#include <utility>    // std::forward
#include <limits>     // std::numeric_limits<
#include <atomic>
#include <cstdint>
#include <type_traits>

#if defined(OS_LINUX) || defined(OS_OSX)
#include <time.h>         // timespec
#include <unistd.h>
#endif

#define ptStringNullGuard(s) ((s)==nullptr ? "" : (s))


#define ptIsFlag(f,m)    (((f) & (m)) ? true : false)            // Test if any one of a the bits in 'm' is also set in 'f'.
#define ptIsNotFlag(f,m) (ptIsFlag(f,m)==false)                  // Test if none of the bits in 'm' are set in 'f'.
#define ptSetFlag(f,m)   ((f) | (m))                             // Return 'f' with the bits in 'm' set.
#define ptClrFlag(f,m)   ((f) & (~(m)))                          // Return 'f' with the bits in 'm' cleared.
#define ptEnaFlag(f,m,b) ((b) ? ptSetFlag(f,m) : ptClrFlag(f,m)) // Set or clear bits in 'f' based on bits in 'm' and the state of 'b'.


namespace pt
{

#define ptAssert(C)       while(1){ if(!(C)) { ptLogFatal(kAssertFailRC,"Assert failed on condition:%s",#C ); assert(0); } break; }


  template< typename H, typename T >
    T* handleToPtr( H h )
  {
    ptAssert( h.p != nullptr );
    return h.p;
  }

  typedef struct idLabelPair_str
  {
    unsigned    id;
    const char* label;
  } idLabelPair_t;

  // Return nullptr if id is not found.
  const char* idToLabelNull( const idLabelPair_t* array, unsigned id, unsigned eolId );

  // Returns label in 'eolId' slot if id is not found.
  const char* idToLabel( const idLabelPair_t* array, unsigned id, unsigned eolId );

  // Returns eolId if the label is not found. The comparison ignores case.
  unsigned    labelToIdNoCase( const idLabelPair_t* array, const char* label, unsigned eolId );


  void sleepMs( unsigned ms ); // sleep milliseconds
  void sleepUs( unsigned us ); // sleep microseconds

  void report_dependency_versions();

}

#endif
