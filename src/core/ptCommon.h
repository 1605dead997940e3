//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptCOMMON_H
#define ptCOMMON_H

#include <cstdio>  // declares 'NULL'
#include <cstdarg>



#define kInvalidIdx ((unsigned)-1)
#define kInvalidCnt ((unsigned)-1)


namespace pt
{

  typedef enum
  {
   kOkRC = 0,               // 0
   kObjAllocFailRC,         // 1 - an object allocation failed
   kObjFreeFailRC,          // 2 - an object free failed
   kInvalidOpRC,            // 3 - the current state does not support the operation
   kInvalidArgRC,           // 4 - empty or null document, path or argument
   kInvalidIdRC,            // 5 - an identifer was found to be invalid
   kOpenFailRC,             // 6
   kCloseFailRC,            // 7
   kWriteFailRC,            // 8
   kReadFailRC,             // 9
   kEofRC,                  // 10
   kResourceNotAvailableRC, // 11 - no MIDI device is available
   kMemAllocFailRC,         // 12
   kTimeOutRC,              // 13
   kOpFailRC,               // 14
   kSyntaxErrorRC,          // 15 - malformed markup or config text
   kLabelNotFoundRC,        // 16 - use by ptObject to indicate that an optional value does not exist.
   kEleNotFoundRC,          // 17
   kDuplicateRC,            // 18 - an invalid duplicate was detected
   kNotImplRC,              // 19 - the document kind is recognized but not supported
   kAssertFailRC,           // 20 - used with ptLogFatal
   kBaseAppRC               // 21
  } ptRC_t;

  typedef unsigned rc_t;


  template< typename T >
    struct handle
  {
    typedef T p_type;
    T* p = nullptr;

    void set(T* ptr)     { this->p=ptr; }
    void clear()         { this->p=nullptr; }
    bool isValid() const { return this->p != nullptr; }
  };

}


#endif
