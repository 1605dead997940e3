//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptObject_H
#define ptObject_H

// Configuration object tree.
//
// Text syntax:
//   { label: value, label: value ... }
//   value  = dict | list | "quoted string" | identifier | int | real | true | false | null
//   list   = [ value, value ... ]
//   Commas are optional. '//' begins a comment which runs to the end of the line.

namespace pt
{

  enum
  {
   kInvalidTId = 0x00000000,
   kNullTId    = 0x00000001,
   kBoolTId    = 0x00000002,
   kIntTId     = 0x00000004,
   kDoubleTId  = 0x00000008,
   kStringTId  = 0x00000010,
   kPairTId    = 0x00000020,
   kListTId    = 0x00000040,
   kDictTId    = 0x00000080,
   kRootTId    = 0x00000100,

   kOptFl      = 0x40000000
  };

  typedef unsigned objTypeId_t;

  enum
  {
   kRecurseFl      = 0x01,
   kOptionalFl     = 0x02
  };

  typedef struct object_str
  {
    objTypeId_t        tid     = kInvalidTId;
    struct object_str* parent  = nullptr;
    struct object_str* sibling = nullptr;
    union
    {
      long long          i;
      bool               b;
      double             d;
      char*              str;
      struct object_str* children; // 'children' is valid when is_container()==true
    } u;


    // Unlink this node from it's parents and siblings.
    void unlink();

    // free all resource associated with this object.
    void free();

    // Append the child node to this objects child list.
    rc_t append_child( struct object_str* child );

    unsigned child_count() const;

    // Containers have children and use the object.u.children pointer.
    inline bool is_container() const { return tid==kPairTId || tid==kListTId || tid==kDictTId || tid==kRootTId; }
    inline bool is_pair()      const { return tid == kPairTId; }
    inline bool is_dict()      const { return tid == kDictTId; }
    inline bool is_list()      const { return tid == kListTId; }
    inline bool is_string()    const { return tid == kStringTId; }

    rc_t value( int& v ) const;
    rc_t value( unsigned& v ) const;
    rc_t value( long long& v ) const;
    rc_t value( float&  v ) const;
    rc_t value( double& v ) const;
    rc_t value( bool& v ) const;
    rc_t value( const char*& v ) const;
    rc_t value( const struct object_str*& v) const {v=this; return kOkRC; }

    const char* pair_label() const;

    const struct object_str* pair_value() const;

    // Search for the pair label 'label'.
    // Return a pointer to the pair value associated with a given pair label.
    // Set flags to kRecurseFl to recurse into the object in search of the label.
    const struct object_str* find( const char* label, unsigned flags=0 ) const;

    const struct object_str* child_ele( unsigned idx ) const;

    // Set 'ele' to nullptr to return first child.  Returns nullptr when 'ele' is last child.
    const struct object_str* next_child_ele( const struct object_str* ele) const;

    typedef struct read_str
    {
      const char* label;
      unsigned    flags;
      const struct read_str* link;
    } read_t;

    template< typename T >
    rc_t read( const char* label, unsigned flags, T& v ) const
    {
      const struct object_str* o;
      if((o = find(label, 0)) == nullptr )
      {
        if( ptIsNotFlag(flags, kOptFl) )
          return ptLogError(kInvalidIdRC,"The pair label '%s' could not be found.",ptStringNullGuard(label));

        return kEleNotFoundRC;
      }
      else
      {
        flags = ptClrFlag(flags,kOptFl);
        if( flags &&  ptIsNotFlag(o->tid,flags) )
          return ptLogError(kSyntaxErrorRC,"The field '%s' data type 0x%x does not match 0x%x.",ptStringNullGuard(label),o->tid,flags);
      }

      return o->value(v);
    }

    // Verify that every label in this dictionary was named in the readv() call.
    // This prevents mispelled fields from being inadvertently skipped.
    rc_t _readv(const read_t* list) const;

    template< typename T0, typename T1, typename... ARGS >
    rc_t _readv( const read_t* list, T0 label, unsigned flags, T1& valRef, ARGS&&... args ) const
    {
      rc_t rc = read(label,flags,valRef);

      read_t r = { label, flags, list };

      // if no error occurred ....
      if( rc == kOkRC || (rc == kEleNotFoundRC && ptIsFlag(flags,kOptFl)))
        rc =  _readv(&r, std::forward<ARGS>(args)...); // ... recurse to find next label/value pair
      else
        rc = ptLogError(rc,"Object parse failed for the pair label:'%s'.",ptStringNullGuard(label));

      return rc;
    }


    // readv("label0",flags0,v0,"label1",flags0,v1, ... )
    // Use kOptFl for optional fields.
    // Use kListTId and kDictTId to validate the type of container fields.
    template< typename T0, typename T1, typename... ARGS >
    rc_t readv( T0 label, unsigned flags, T1& valRef, ARGS&&... args ) const
      { return _readv(nullptr, label,flags,valRef,args...); }


    // Set flag  'kRecurseFl' to recurse into the object in search of the value.
    // Set flag  'kOptionalFl' if the label is optional and may not exist.
    template< typename T >
      rc_t get( const char* label, T& v, unsigned flags=0  ) const
    {
      const struct object_str* o;
      if((o = find(label, flags)) == nullptr )
      {
        if( ptIsNotFlag(flags, kOptionalFl) )
          return ptLogError(kInvalidIdRC,"The pair label '%s' could not be found.",ptStringNullGuard(label));

        return kEleNotFoundRC;

      }
      return o->value(v);
    }

    rc_t _getv(unsigned flags) const { return kOkRC; }

    template< typename T0, typename T1, typename... ARGS >
      rc_t _getv( unsigned flags, T0 label, T1& valRef, ARGS&&... args ) const
    {
      rc_t rc = get(label,valRef,flags);

      // if no error occurred ....
      if( rc == kOkRC || (rc == kEleNotFoundRC && ptIsFlag(flags,kOptionalFl)))
        rc =  _getv(flags, std::forward<ARGS>(args)...); // ... recurse to find next label/value pair
      else
        rc = ptLogError(rc,"Object parse failed for the pair label:'%s'.",ptStringNullGuard(label));

      return rc;
    }

    // getv("label0",v0,"label1",v1, ... )
    template< typename T0, typename T1, typename... ARGS >
      rc_t getv( T0 label, T1& valRef, ARGS&&... args ) const
    { return _getv(0,label,valRef,args...); }

    // getv("label0",v0,"label1",v1, ... ) where all values are optional
    template< typename T0, typename T1, typename... ARGS >
      rc_t getv_opt( T0 label, T1& valRef, ARGS&&... args ) const
    { return _getv(kOptionalFl,label,valRef,args...); }

    // print this object
    void print( unsigned indent=0 ) const;

  } object_t;

  rc_t objectFromString( const char* s, object_t*& objRef );
  rc_t objectFromFile( const char* fn, object_t*& objRef );

}

#endif
