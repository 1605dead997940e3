//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptFile_H
#define ptFile_H

namespace pt
{
  namespace file
  {

    typedef handle<struct file_str> handle_t;

    enum openFlags_t
    {
     kReadFl   = 0x01, //< Open a file for reading
     kWriteFl  = 0x02, //< Create an empty file for writing
     kAppendFl = 0x04, //< Open a file for writing at the end of the file.
     kBinaryFl = 0x10, //< Open a file for binary (not text) input/output.
    };

    // Open or create a file. Equivalent to fopen().
    // If 'hRef' is a valid handle then it is closed prior to being re-initialized.
    rc_t open( handle_t& hRef, const char* fn, unsigned flags );

    // Close a file opened with open(). Equivalent to fclose().
    rc_t close( handle_t& hRef );

    // Read a block bytes from a file. Equivalent to fread().
    // Returns kEofRC if fewer than 'bufByteCnt' bytes were available.
    rc_t read(  handle_t h, void* buf, unsigned bufByteCnt, unsigned* actualByteCntRef=nullptr );

    // Write a block of bytes to a file. Equivalent to fwrite().
    rc_t write( handle_t h, const void* buf, unsigned bufByteCnt );

    // Return the length of the file in bytes
    unsigned byteCount( handle_t h );

    // Allocate and fill a zero terminated string from the file 'fn'.
    // Returns nullptr if the file could not be opened or read.
    // Set *bufByteCntPtr to count of bytes read into the buffer.
    // Release the returned buffer with mem::release().
    char* fnToStr( const char* fn, unsigned* bufByteCntPtr );
  }
}

#endif
