//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptText_H
#define ptText_H


namespace pt
{
  // Return 0 if s is null.
  unsigned textLength( const char* s );

  // if both s0 and s1 are nullptr then a match is indicated
  int textCompare( const char* s0, const char* s1 );
  int textCompare( const char* s0, const char* s1, unsigned n);

  inline bool textIsEqual( const char* s0, const char* s1 )             { return textCompare(s0,s1) == 0; }
  inline bool textIsEqual( const char* s0, const char* s1, unsigned n ) { return textCompare(s0,s1,n) == 0; }

  inline bool textIsNotEqual( const char* s0, const char* s1 )             { return !textIsEqual(s0,s1);   }

  // Return a pointer to the next non-white space char
  // or nullptr if 's' is null are there are no non-whitespace char's.
  const char* nextNonWhiteChar( const char* s );

  // Return a pointer to the next non-white space char,
  // a pointer to the EOS if there are no non-white space char's,
  // or nullptr if 's' is null.
  const char* nextNonWhiteCharEOS( const char* s );

  // Return true if s[] is null, empty or contains only white space.
  bool textIsBlank( const char* s );

  // Return true if 's' begins with 'prefix'.
  bool textStartsWith( const char* s, const char* prefix );

  // Remove leading and trailing white space from s[] in place and return s.
  char* textTrim( char* s );

}

#endif
