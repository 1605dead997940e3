//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptFile.h"
#include "ptObject.h"

namespace pt
{
  enum
  {
   kErrorLexTId,
   kEofLexTId,
   kLCurlyLexTId,
   kRCurlyLexTId,
   kLHardLexTId,
   kRHardLexTId,
   kColonLexTId,
   kCommaLexTId,
   kIntLexTId,
   kRealLexTId,
   kTrueLexTId,
   kFalseLexTId,
   kNullLexTId,
   kIdentLexTId,
   kQStrLexTId
  };

  typedef struct lex_str
  {
    const char* text;      // source text
    const char* c;         // current char
    unsigned    lineNo;    // current line number
    const char* tokText;   // first char of the current token
    unsigned    tokN;      // count of chars in the current token
  } lex_t;

  idLabelPair_t _objTokenArray[] =
  {
   { kTrueLexTId,  "true"  },
   { kFalseLexTId, "false" },
   { kNullLexTId,  "null"  },
   { kErrorLexTId, nullptr }
  };

  rc_t _objSyntaxError( const lex_t& lex, const char* fmt, ... )
  {
    va_list vl;
    va_start(vl,fmt);

    int  n = vsnprintf(nullptr,0,fmt,vl);
    char msg[n+1];
    va_end(vl);

    va_start(vl,fmt);
    vsnprintf(msg,n+1,fmt,vl);
    va_end(vl);

    return ptLogError(kSyntaxErrorRC,"Object syntax error on line %i: %s",lex.lineNo,msg);
  }

  // Advance past white space and comments.
  void _lexSkip( lex_t& lex )
  {
    for(;;)
    {
      const char* c = lex.c;

      while( *lex.c && isspace((unsigned char)*lex.c) )
      {
        if( *lex.c == '\n' )
          ++lex.lineNo;
        ++lex.c;
      }

      if( lex.c[0]=='/' && lex.c[1]=='/' )
        while( *lex.c && *lex.c != '\n' )
          ++lex.c;

      if( lex.c == c )
        break;
    }
  }

  bool _isIdentChar( char c, bool firstFl )
  { return isalpha((unsigned char)c) || c=='_' || (!firstFl && (isdigit((unsigned char)c) || c=='.' || c=='-')); }

  unsigned _lexNumber( lex_t& lex )
  {
    const char* c      = lex.c;
    bool        realFl = false;

    if( *c=='-' || *c=='+' )
      ++c;

    if( !isdigit((unsigned char)*c) && !(*c=='.' && isdigit((unsigned char)c[1])) )
      return kErrorLexTId;

    while( isdigit((unsigned char)*c) )
      ++c;

    if( *c == '.' )
    {
      realFl = true;
      ++c;
      while( isdigit((unsigned char)*c) )
        ++c;
    }

    if( *c=='e' || *c=='E' )
    {
      const char* e = c+1;
      if( *e=='-' || *e=='+' )
        ++e;

      if( isdigit((unsigned char)*e) )
      {
        realFl = true;
        for(c=e; isdigit((unsigned char)*c); ++c)
        {}
      }
    }

    lex.tokN = c - lex.c;
    lex.c    = c;

    return realFl ? kRealLexTId : kIntLexTId;
  }

  unsigned _lexNextToken( lex_t& lex )
  {
    _lexSkip(lex);

    lex.tokText = lex.c;
    lex.tokN    = 1;

    switch( *lex.c )
    {
      case 0:   lex.tokN=0; return kEofLexTId;
      case '{': ++lex.c; return kLCurlyLexTId;
      case '}': ++lex.c; return kRCurlyLexTId;
      case '[': ++lex.c; return kLHardLexTId;
      case ']': ++lex.c; return kRHardLexTId;
      case ':': ++lex.c; return kColonLexTId;
      case ',': ++lex.c; return kCommaLexTId;

      case '"':
        {
          const char* c = ++lex.c;
          for(; *c && *c!='"'; ++c)
          {
            if( *c=='\\' && c[1] )
              ++c;
            else
              if( *c=='\n' )
                ++lex.lineNo;
          }

          if( *c != '"' )
            return kErrorLexTId;

          lex.tokText = lex.c;
          lex.tokN    = c - lex.c;
          lex.c       = c + 1;
          return kQStrLexTId;
        }
    }

    if( _isIdentChar(*lex.c,true) )
    {
      const char* c = lex.c;
      while( _isIdentChar(*c,false) )
        ++c;

      lex.tokN = c - lex.c;
      lex.c    = c;

      for(unsigned i=0; _objTokenArray[i].id != kErrorLexTId; ++i)
        if( strlen(_objTokenArray[i].label)==lex.tokN && textIsEqual(_objTokenArray[i].label,lex.tokText,lex.tokN) )
          return _objTokenArray[i].id;

      return kIdentLexTId;
    }

    return _lexNumber(lex);
  }

  object_t* _objAllocate( objTypeId_t tid, object_t* parent )
  {
    object_t* o = mem::allocZ<object_t>();
    o->tid      = tid;
    o->parent   = parent;
    return o;
  }

  // Append 'child' to 'parent'. A dictionary only accepts pairs and a
  // pair only accepts a label and a single value.
  object_t* _objAppendNode( const lex_t& lex, object_t* parent, object_t* child )
  {
    if( parent->is_dict() && !child->is_pair() )
    {
      _objSyntaxError(lex,"Only 'label:value' pairs may be placed in a dictionary.");
      child->free();
      return nullptr;
    }

    if( parent->is_pair() && parent->child_count() >= 2 )
    {
      _objSyntaxError(lex,"A pair may only contain a single value.");
      child->free();
      return nullptr;
    }

    if( parent->append_child(child) != kOkRC )
    {
      child->free();
      return nullptr;
    }

    return child;
  }

  char* _objUnescapeString( const char* s, unsigned sn )
  {
    char*    d = mem::alloc<char>(sn+1);
    unsigned j = 0;

    for(unsigned i=0; i<sn; ++i)
    {
      if( s[i]=='\\' && i+1<sn )
      {
        ++i;
        switch( s[i] )
        {
          case 'n': d[j++] = '\n'; break;
          case 't': d[j++] = '\t'; break;
          default:  d[j++] = s[i]; break;
        }
      }
      else
        d[j++] = s[i];
    }

    d[j] = 0;
    return d;
  }

  void _objPrintIndent( unsigned indent )
  {
    for(unsigned i=0; i<indent; ++i)
      printf(" ");
  }
}

void pt::object_t::unlink()
{
  if( parent == nullptr )
    return;

  object_t* c0 = nullptr;
  object_t* c1 = parent->u.children;

  for(; c1!=nullptr; c1=c1->sibling)
  {
    if( c1 == this )
    {
      if( c0 == nullptr )
        parent->u.children = c1->sibling;
      else
        c0->sibling = c1->sibling;

      c1->sibling = nullptr;
      break;
    }

    c0 = c1;
  }

  parent = nullptr;
}

void pt::object_t::free()
{
  if( is_container() )
  {
    object_t* o1 = nullptr;
    for(object_t* o=u.children; o!=nullptr; o=o1)
    {
      o1 = o->sibling;
      o->parent = nullptr;  // the parent is being released so there is no need to unlink
      o->free();
    }
  }
  else
    if( is_string() )
      mem::release(u.str);

  unlink();

  object_t* self = this;
  mem::release(self);
}

pt::rc_t pt::object_t::append_child( object_t* child )
{
  if( !is_container() )
    return ptLogError(kInvalidOpRC,"Cannot append a child to a non-container object.");

  child->parent  = this;
  child->sibling = nullptr;

  if( u.children == nullptr )
    u.children = child;
  else
  {
    object_t* c = u.children;
    while( c->sibling != nullptr )
      c = c->sibling;

    c->sibling = child;
  }

  return kOkRC;
}

unsigned pt::object_t::child_count() const
{
  unsigned n = 0;
  if( is_container() )
    for(const object_t* o=u.children; o!=nullptr; o=o->sibling)
      ++n;

  return n;
}

pt::rc_t pt::object_t::value( long long& v ) const
{
  switch( tid )
  {
    case kIntTId:    v = u.i; break;
    case kDoubleTId: v = (long long)u.d; break;
    case kBoolTId:   v = u.b ? 1 : 0; break;
    default:
      return ptLogError(kInvalidArgRC,"The object type 0x%x cannot be converted to an integer.",tid);
  }
  return kOkRC;
}

pt::rc_t pt::object_t::value( int& v ) const
{
  rc_t      rc;
  long long x = 0;

  if((rc = value(x)) != kOkRC )
    return rc;

  if( x < INT_MIN || x > INT_MAX )
    return ptLogError(kInvalidArgRC,"The value %lli is out of the range of an 'int'.",x);

  v = (int)x;
  return rc;
}

pt::rc_t pt::object_t::value( unsigned& v ) const
{
  rc_t      rc;
  long long x = 0;

  if((rc = value(x)) != kOkRC )
    return rc;

  if( x < 0 || x > UINT_MAX )
    return ptLogError(kInvalidArgRC,"The value %lli is out of the range of an 'unsigned'.",x);

  v = (unsigned)x;
  return rc;
}

pt::rc_t pt::object_t::value( double& v ) const
{
  switch( tid )
  {
    case kIntTId:    v = (double)u.i; break;
    case kDoubleTId: v = u.d; break;
    default:
      return ptLogError(kInvalidArgRC,"The object type 0x%x cannot be converted to a real number.",tid);
  }
  return kOkRC;
}

pt::rc_t pt::object_t::value( float& v ) const
{
  double d = 0;
  rc_t   rc;
  if((rc = value(d)) == kOkRC )
    v = (float)d;
  return rc;
}

pt::rc_t pt::object_t::value( bool& v ) const
{
  if( tid != kBoolTId )
    return ptLogError(kInvalidArgRC,"The object type 0x%x cannot be converted to a 'bool'.",tid);

  v = u.b;
  return kOkRC;
}

pt::rc_t pt::object_t::value( const char*& v ) const
{
  if( tid != kStringTId )
    return ptLogError(kInvalidArgRC,"The object type 0x%x cannot be converted to a string.",tid);

  v = u.str;
  return kOkRC;
}

const char* pt::object_t::pair_label() const
{
  if( !is_pair() || u.children==nullptr || !u.children->is_string() )
    return nullptr;

  return u.children->u.str;
}

const pt::object_t* pt::object_t::pair_value() const
{
  if( !is_pair() || u.children==nullptr )
    return nullptr;

  return u.children->sibling;
}

const pt::object_t* pt::object_t::find( const char* label, unsigned flags ) const
{
  if( is_container() )
  {
    for(const object_t* o=u.children; o!=nullptr; o=o->sibling)
    {
      if( o->is_pair() && textIsEqual(o->pair_label(),label) )
        return o->pair_value();

      if( ptIsFlag(flags,kRecurseFl) )
      {
        const object_t* r;
        if((r = o->find(label,flags)) != nullptr )
          return r;
      }
    }
  }

  return nullptr;
}

const pt::object_t* pt::object_t::child_ele( unsigned idx ) const
{
  unsigned i = 0;
  if( is_container() )
    for(const object_t* o=u.children; o!=nullptr; o=o->sibling,++i)
      if( i == idx )
        return o;

  return nullptr;
}

const pt::object_t* pt::object_t::next_child_ele( const object_t* ele ) const
{
  if( !is_container() )
    return nullptr;

  return ele == nullptr ? u.children : ele->sibling;
}

pt::rc_t pt::object_t::_readv( const read_t* list ) const
{
  if( !is_dict() )
    return kOkRC;

  for(const object_t* child=u.children; child!=nullptr; child=child->sibling)
  {
    const char*   label = child->pair_label();
    const read_t* r     = list;

    if( label == nullptr )
      return ptLogError(kSyntaxErrorRC,"A blank label was encountered as a dictionary label.");

    for(; r!=nullptr; r=r->link)
      if( textIsEqual(r->label,label) )
        break;

    if( r == nullptr )
      return ptLogError(kSyntaxErrorRC,"The unknown field '%s' was encountered.",label);
  }

  return kOkRC;
}

void pt::object_t::print( unsigned indent ) const
{
  switch( tid )
  {
    case kNullTId:   printf("null"); break;
    case kBoolTId:   printf("%s",u.b ? "true" : "false"); break;
    case kIntTId:    printf("%lli",u.i); break;
    case kDoubleTId: printf("%f",u.d); break;
    case kStringTId: printf("\"%s\"",ptStringNullGuard(u.str)); break;

    case kPairTId:
      printf("%s: ",ptStringNullGuard(pair_label()));
      if( pair_value() != nullptr )
        pair_value()->print(indent);
      break;

    case kListTId:
      printf("[ ");
      for(const object_t* o=u.children; o!=nullptr; o=o->sibling)
      {
        o->print(indent);
        printf(" ");
      }
      printf("]");
      break;

    case kDictTId:
    case kRootTId:
      printf("{\n");
      for(const object_t* o=u.children; o!=nullptr; o=o->sibling)
      {
        _objPrintIndent(indent+2);
        o->print(indent+2);
        printf("\n");
      }
      _objPrintIndent(indent);
      printf("}");
      break;
  }

  if( indent == 0 )
    printf("\n");
}


pt::rc_t pt::objectFromString( const char* s, object_t*& objRef )
{
  rc_t      rc    = kOkRC;
  unsigned  lexId = kErrorLexTId;
  object_t* root  = _objAllocate(kRootTId,nullptr);
  object_t* cnp   = root;
  lex_t     lex;

  objRef = nullptr;

  if( textLength(s) == 0 )
  {
    rc = ptLogError(kInvalidArgRC,"The object text is empty.");
    goto errLabel;
  }

  lex.text    = s;
  lex.c       = s;
  lex.lineNo  = 1;
  lex.tokText = s;
  lex.tokN    = 0;

  // main parser loop
  while( rc == kOkRC && (lexId = _lexNextToken(lex)) != kEofLexTId )
  {
    object_t* o = nullptr;

    switch( lexId )
    {
      case kErrorLexTId:
        rc = _objSyntaxError(lex,"Unrecognized text near '%.*s'.", 16, lex.tokText );
        break;

      case kLCurlyLexTId:
        if((o = _objAppendNode( lex, cnp, _objAllocate(kDictTId,cnp) )) != nullptr )
          cnp = o;
        break;

      case kRCurlyLexTId:
        if( !cnp->is_dict() )
          rc = _objSyntaxError(lex,"An end of 'object' was encountered without an associated 'object' start.");
        else
          cnp = cnp->parent;
        break;

      case kLHardLexTId:
        if((o = _objAppendNode( lex, cnp, _objAllocate(kListTId,cnp) )) != nullptr )
          cnp = o;
        break;

      case kRHardLexTId:
        if( !cnp->is_list() )
          rc = _objSyntaxError(lex,"An end of 'array' was encountered without an associated 'array' start.");
        else
          cnp = cnp->parent;
        break;

      case kColonLexTId:
        if( !cnp->is_pair() || cnp->child_count() != 1 )
          rc = _objSyntaxError(lex,"A colon was encountered outside a 'pair' node.");
        break;

      case kCommaLexTId:
        if( !cnp->is_list() && !cnp->is_dict() )
          rc = _objSyntaxError(lex,"Unexpected comma outside of 'array' or 'object'.");
        break;

      case kIntLexTId:
      case kRealLexTId:
        {
          char buf[ lex.tokN + 1 ];
          strncpy(buf,lex.tokText,lex.tokN);
          buf[lex.tokN] = 0;

          o = _objAllocate( lexId==kIntLexTId ? kIntTId : kDoubleTId, cnp );

          if( lexId == kIntLexTId )
            o->u.i = strtoll(buf,nullptr,10);
          else
            o->u.d = strtod(buf,nullptr);

          o = _objAppendNode(lex,cnp,o);
        }
        break;

      case kTrueLexTId:
      case kFalseLexTId:
        o = _objAllocate( kBoolTId, cnp );
        o->u.b = lexId == kTrueLexTId;
        o = _objAppendNode(lex,cnp,o);
        break;

      case kNullLexTId:
        o = _objAppendNode(lex,cnp,_objAllocate( kNullTId, cnp ));
        break;

      case kIdentLexTId:
      case kQStrLexTId:
        {
          // if the parent is a dictionary then this string must be a pair label
          if( cnp->is_dict() )
          {
            if((o = _objAppendNode( lex, cnp, _objAllocate( kPairTId, cnp ))) == nullptr )
              break;
            cnp = o;
          }

          o        = _objAllocate( kStringTId, cnp );
          o->u.str = _objUnescapeString(lex.tokText,lex.tokN);
          o        = _objAppendNode(lex,cnp,o);
        }
        break;

      default:
        rc = _objSyntaxError(lex,"Unknown token type (%i) in text.", int(lexId) );
    }

    if( rc == kOkRC && o == nullptr && lexId != kRCurlyLexTId && lexId != kRHardLexTId && lexId != kColonLexTId && lexId != kCommaLexTId )
      rc = kSyntaxErrorRC;

    if( rc == kOkRC && cnp == nullptr )
      rc = _objSyntaxError( lex, "Node parse failed." );

    if( rc != kOkRC )
      goto errLabel;

    // if this is a pair node and it now has both values
    // then make the parent 'object' the current node
    if( cnp->is_pair() && cnp->child_count()==2 )
      cnp = cnp->parent;
  }

  if( cnp != root )
  {
    rc = _objSyntaxError(lex,"The text ended inside an unterminated 'object', 'array' or 'pair'.");
    goto errLabel;
  }

  // if the root has only one child then make the child the root
  if( root->child_count() == 1 )
  {
    cnp = root->u.children;
    cnp->unlink();
    root->free();
    root = cnp;
  }

  objRef = root;
  root   = nullptr;

errLabel:
  if( root != nullptr )
    root->free();

  return rc;
}

pt::rc_t pt::objectFromFile( const char* fn, object_t*& objRef )
{
  rc_t     rc         = kOkRC;
  unsigned bufByteCnt = 0;
  char*    buf        = nullptr;

  objRef = nullptr;

  if(( buf = file::fnToStr(fn, &bufByteCnt)) == nullptr )
    rc = ptLogError(kOpenFailRC,"File to text buffer conversion failed on '%s'.",ptStringNullGuard(fn));
  else
  {
    if((rc = objectFromString( buf, objRef )) != kOkRC )
      rc = ptLogError(rc,"Object parse failed on '%s'.",ptStringNullGuard(fn));

    mem::release(buf);
  }

  return rc;
}
