//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"

namespace pt
{
  namespace mem
  {
    // Every block is prefixed by a two word header. Word 0 holds the
    // count of user bytes in the block. Word 1 is padding which keeps
    // the user pointer 8 byte aligned.
    enum { kHdrWordN = 2 };

    unsigned* _baseOf( void* p ) { return static_cast<unsigned*>(p) - kHdrWordN; }
  }
}

void* pt::mem::_alloc( void* p0, unsigned n, unsigned flags )
{
  unsigned  p0N  = 0;         // user byte count of the existing block

  // if there is an existing block
  if( p0 != nullptr )
  {
    p0N = _baseOf(p0)[0];

    // if the block is shrinking
    if( p0N >= n )
      return p0;
  }

  unsigned* p1 = static_cast<unsigned*>(malloc(n + kHdrWordN*sizeof(unsigned)));

  if( p1 == nullptr )
  {
    ptLogFatal(kMemAllocFailRC,"Memory allocation of %i bytes failed.",n);
    return nullptr;
  }

  char* u = reinterpret_cast<char*>(p1 + kHdrWordN);

  // if expanding then copy in data from existing block
  if( p0 != nullptr )
  {
    memcpy(u,p0,p0N);
    mem::free(p0);
  }

  if( ptIsFlag(flags, kZeroAllFl))
    memset(u,0,n);
  else
    if( ptIsFlag(flags, kZeroNewFl ))
      memset(u+p0N,0,n-p0N);

  p1[0] = n;
  p1[1] = 0;

  return u;
}


unsigned pt::mem::byteCount( const void* p )
{
  return p==nullptr ? 0 : (static_cast<const unsigned*>(p) - kHdrWordN)[0];
}


char* pt::mem::allocStr( const char* s )
{
  char* s1 = nullptr;

  if( s != nullptr )
  {
    unsigned sn = strlen(s);
    s1 = static_cast<char*>(_alloc(nullptr,sn+1,0));
    memcpy(s1,s,sn);
    s1[sn] = 0;
  }

  return s1;
}


void pt::mem::free( void* p )
{
  if( p != nullptr)
    ::free(_baseOf(p));
}
