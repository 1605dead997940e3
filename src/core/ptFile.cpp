//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptFile.h"

#include <sys/stat.h>

namespace pt
{

  namespace file
  {
    typedef struct file_str
    {
      FILE* fp;
      char* fnStr;
      rc_t  lastRC;
    } this_t;


    this_t* _handleToPtr(handle_t h)
    {
      return handleToPtr<handle_t,this_t>(h);
    }

    char*  _fileToStr( handle_t h, unsigned* bufByteCntPtr )
    {
      unsigned n   = byteCount(h);
      char*    buf = nullptr;

      if( _handleToPtr(h)->lastRC != kOkRC )
        goto errLabel;

      // allocate the read target buffer with space for the terminating zero
      buf = mem::alloc<char>(n+1);

      if( n > 0 )
        if( read(h,buf,n) != kOkRC )
          goto errLabel;

      buf[n] = 0;

      if( bufByteCntPtr != nullptr )
        *bufByteCntPtr = n;

      return buf;

    errLabel:
      if( bufByteCntPtr != nullptr )
        *bufByteCntPtr = 0;

      mem::release(buf);

      return nullptr;
    }
  }
}

pt::rc_t pt::file::open( handle_t& hRef, const char* fn, unsigned flags )
{
  this_t* p      = nullptr;
  rc_t    rc     = kOkRC;
  char    mode[] = "\0\0\0";

  if((rc = close(hRef)) != kOkRC )
    return rc;

  if( ptIsFlag(flags,kReadFl) )
    mode[0]     = 'r';
  else
    if( ptIsFlag(flags,kWriteFl) )
      mode[0]   = 'w';
    else
      if( ptIsFlag(flags,kAppendFl) )
        mode[0] = 'a';
      else
        return ptLogError(kInvalidArgRC,"File open flags must contain 'kReadFl','kWriteFl', or 'kAppendFl'.");

  if( ptIsFlag(flags,kBinaryFl) )
    mode[1] = 'b';

  // verify the filename is not empty
  if( textLength(fn)==0 )
    return ptLogError(kInvalidArgRC,"File object allocation failed due to empty file name.");

  p        = mem::allocZ<this_t>();
  p->fnStr = mem::allocStr(fn);

  errno = 0;
  if((p->fp = fopen(fn,mode)) == nullptr )
    rc = ptLogSysError(kOpenFailRC,errno,"File open failed on file:'%s'.",ptStringNullGuard(fn));

  if( rc != kOkRC )
  {
    mem::release(p->fnStr);
    mem::release(p);
  }
  else
    hRef.set(p);

  return rc;
}

pt::rc_t pt::file::close( handle_t& hRef )
{
  if( !hRef.isValid() )
    return kOkRC;

  this_t* p = _handleToPtr(hRef);

  errno = 0;
  if( p->fp != nullptr )
    if( fclose(p->fp) != 0 )
      return p->lastRC = ptLogSysError(kCloseFailRC,errno,"File close failed on '%s'.", ptStringNullGuard(p->fnStr));

  mem::release(p->fnStr);
  mem::release(p);
  hRef.clear();

  return kOkRC;
}

pt::rc_t pt::file::read( handle_t h, void* buf, unsigned bufByteCnt, unsigned* actualByteCntRef )
{
  rc_t     rc            = kOkRC;
  this_t*  p             = _handleToPtr(h);
  unsigned actualByteCnt = 0;

  if( p->lastRC != kOkRC )
    return p->lastRC;

  errno = 0;
  if(( actualByteCnt = fread(buf,1,bufByteCnt,p->fp)) != bufByteCnt )
  {
    if( feof( p->fp ) != 0 )
      rc = p->lastRC = kEofRC;
    else
      rc = p->lastRC = ptLogSysError(kReadFailRC,errno,"File read failed on '%s'.", ptStringNullGuard(p->fnStr));
  }

  if( actualByteCntRef != nullptr )
    *actualByteCntRef = actualByteCnt;

  return rc;
}

pt::rc_t pt::file::write( handle_t h, const void* buf, unsigned bufByteCnt )
{
  this_t* p = _handleToPtr(h);

  if( p->lastRC != kOkRC )
    return p->lastRC;

  if( bufByteCnt )
  {
    errno = 0;
    if( fwrite(buf,bufByteCnt,1,p->fp) != 1 )
      return p->lastRC = ptLogSysError(kWriteFailRC,errno,"File write failed on '%s'.", ptStringNullGuard(p->fnStr));
  }

  return kOkRC;
}

unsigned pt::file::byteCount( handle_t h )
{
  struct stat sr;
  int         f;
  this_t*     p       = _handleToPtr(h);
  const char errMsg[] = "File byte count request failed.";

  errno = 0;

  if((f = fileno(p->fp)) == -1)
  {
    p->lastRC = ptLogSysError(kInvalidOpRC,errno,"%s because fileno() failed on '%s'.",errMsg,ptStringNullGuard(p->fnStr));
    return 0;
  }

  if(fstat(f,&sr) == -1)
  {
    p->lastRC = ptLogSysError(kInvalidOpRC,errno,"%s because fstat() failed on '%s'.",errMsg,ptStringNullGuard(p->fnStr));
    return 0;
  }

  return sr.st_size;
}

char* pt::file::fnToStr( const char* fn, unsigned* bufByteCntPtr )
{
  handle_t h;
  char*    buf = nullptr;

  if( open(h,fn,kReadFl | kBinaryFl) == kOkRC )
  {
    buf = _fileToStr(h,bufByteCntPtr);

    if( close(h) != kOkRC )
      mem::release(buf);
  }

  return buf;
}
