//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptText.h"
#include "ptCommonImpl.h"


namespace pt
{
  const char* _nextNonWhiteChar( const char* s, bool eosFl )
  {
    if( s == nullptr )
      return nullptr;

    for(; *s; ++s )
      if( !isspace((unsigned char)*s) )
        return s;

    return eosFl ? s : nullptr;
  }
}


unsigned pt::textLength( const char* s )
{ return s == nullptr ? 0 : strlen(s); }

int pt::textCompare( const char* s0, const char* s1 )
{
  if( s0 == nullptr || s1 == nullptr )
    return s0==s1 ? 0 : 1; // if both pointers are nullptr then trigger a match

  return strcmp(s0,s1);
}

int pt::textCompare( const char* s0, const char* s1, unsigned n)
{
  if( s0 == nullptr || s1 == nullptr )
    return s0==s1 ? 0 : 1; // if both pointers are nullptr then trigger a match

  return strncmp(s0,s1,n);
}

const char* pt::nextNonWhiteChar( const char* s )
{ return _nextNonWhiteChar(s,false); }

const char* pt::nextNonWhiteCharEOS( const char* s )
{ return _nextNonWhiteChar(s,true); }

bool pt::textIsBlank( const char* s )
{ return nextNonWhiteChar(s) == nullptr; }

bool pt::textStartsWith( const char* s, const char* prefix )
{
  if( s == nullptr || prefix == nullptr )
    return false;

  return strncmp(s,prefix,strlen(prefix)) == 0;
}

char* pt::textTrim( char* s )
{
  if( s == nullptr )
    return nullptr;

  char* s0 = const_cast<char*>(nextNonWhiteCharEOS(s));
  unsigned n = strlen(s0);

  while( n>0 && isspace((unsigned char)s0[n-1]) )
    --n;

  memmove(s,s0,n);
  s[n] = 0;

  return s;
}
