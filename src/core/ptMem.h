//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptMem_H
#define ptMem_H

namespace pt
{

  namespace mem
  {
    enum
    {
     kZeroAllFl = 0x01,  // zero the entire block
     kZeroNewFl = 0x02,  // zero only the portion of the block added by a resize
    };

    void* _alloc( void* p, unsigned n, unsigned flags );

    char* allocStr( const char* );
    void  free( void* );

    // Return the count of bytes requested when 'p' was allocated.
    unsigned byteCount( const void* p );

    template<typename T>
      void release(T& p) { ::pt::mem::free(p); p=nullptr; }

    template<typename T>
      T* allocZ(unsigned n=1) { return static_cast<T*>(_alloc(nullptr,n*sizeof(T),kZeroAllFl)); }

    template<typename T>
      T* alloc(unsigned n=1) { return static_cast<T*>(_alloc(nullptr,n*sizeof(T),0)); }

    // Grow 'p' to 'n' elements. Added elements are zeroed and existing elements are preserved.
    template<typename T>
      T* resizeZ(T* p, unsigned n=1) { return static_cast<T*>(_alloc(p,n*sizeof(T),kZeroNewFl)); }


    template<typename T>
      T* duplStr( const T* s, size_t n )
    {
      if( s == nullptr )
        return nullptr;

      // allocate space for new string and the terminating zero
      T* s1 = alloc<T>(n+1);

      for(size_t i=0; i<n; ++i)
        s1[i] = s[i];

      s1[n] = 0;
      return s1;
    }

    template<typename T>
      T* duplStr( const T* s )
    {
      if( s == nullptr )
        return nullptr;

      size_t n=0;
      for(; s[n]; ++n)
      {}

      return duplStr(s,n);
    }

  }

}

#endif
