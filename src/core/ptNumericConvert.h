//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptNumericConvert_H
#define ptNumericConvert_H

namespace pt
{
  template< typename SRC_t, typename DST_t >
    rc_t numeric_convert( const SRC_t& src,  DST_t& dst )
  {
    if( (double)src < (double)std::numeric_limits<DST_t>::lowest() || (double)src > (double)std::numeric_limits<DST_t>::max() )
      return kInvalidArgRC;

    dst = (DST_t)src;
    return kOkRC;
  }

  // Convert the text 's' to a number. Leading and trailing white space is allowed
  // but any other trailing text is an error. 'valueRef' is not changed on error.
  // Errors are not logged. The caller decides if a bad value is an error or should be defaulted.
  template< typename T >
    rc_t string_to_number( const char* s, T& valueRef )
  {
    if( textIsBlank(s) )
      return kInvalidArgRC;

    char* end = nullptr;
    errno = 0;
    long long v = strtoll(s,&end,10);

    if( errno != 0 || end == s || *nextNonWhiteCharEOS(end) != 0 )
      return kSyntaxErrorRC;

    return numeric_convert(v,valueRef);
  }

  template < > inline
    rc_t string_to_number<double>( const char* s, double& valueRef )
  {
    if( textIsBlank(s) )
      return kInvalidArgRC;

    char* end = nullptr;
    errno = 0;
    double v = strtod(s,&end);

    if( errno != 0 || end == s || *nextNonWhiteCharEOS(end) != 0 )
      return kSyntaxErrorRC;

    valueRef = v;
    return kOkRC;
  }

  // Convert 's' to a number or return 'dfltValue' if 's' is missing or malformed.
  template< typename T >
    T string_to_number_or( const char* s, const T& dfltValue )
  {
    T v = dfltValue;
    if( string_to_number(s,v) != kOkRC )
      return dfltValue;
    return v;
  }

}
#endif
