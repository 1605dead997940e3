//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#include "ptCommon.h"
#include "ptLog.h"
#include "ptCommonImpl.h"
#include "ptMem.h"
#include "ptText.h"
#include "ptFile.h"
#include "ptXml.h"

namespace pt
{
  namespace xml
  {
    typedef struct parser_str
    {
      const char* c;       // current char
      unsigned    lineNo;
    } parser_t;

    typedef struct entity_str
    {
      const char* label;
      char        ch;
    } entity_t;

    entity_t _entityArray[] =
    {
     { "lt",   '<'  },
     { "gt",   '>'  },
     { "amp",  '&'  },
     { "quot", '"'  },
     { "apos", '\'' },
     { nullptr, 0   }
    };

    rc_t _syntaxError( const parser_t& p, const char* fmt, ... )
    {
      va_list vl;
      va_start(vl,fmt);

      int  n = vsnprintf(nullptr,0,fmt,vl);
      char msg[n+1];
      va_end(vl);

      va_start(vl,fmt);
      vsnprintf(msg,n+1,fmt,vl);
      va_end(vl);

      return ptLogError(kSyntaxErrorRC,"XML syntax error on line %i: %s",p.lineNo,msg);
    }

    void _advance( parser_t& p, unsigned n=1 )
    {
      for(unsigned i=0; i<n && *p.c; ++i,++p.c)
        if( *p.c == '\n' )
          ++p.lineNo;
    }

    bool _match( parser_t& p, const char* s )
    {
      unsigned n = strlen(s);
      if( strncmp(p.c,s,n) != 0 )
        return false;

      _advance(p,n);
      return true;
    }

    void _skipWhite( parser_t& p )
    {
      while( *p.c && isspace((unsigned char)*p.c) )
        _advance(p);
    }

    // Advance past the next occurrence of 'end'.
    rc_t _skipPast( parser_t& p, const char* end, const char* what )
    {
      const char* e;
      if((e = strstr(p.c,end)) == nullptr )
        return _syntaxError(p,"Unterminated %s.",what);

      _advance(p, (e - p.c) + strlen(end));
      return kOkRC;
    }

    bool _isNameChar( char c, bool firstFl )
    {
      unsigned char uc = (unsigned char)c;

      // bytes of a multi-byte UTF-8 sequence are name characters
      if( uc >= 0x80 || isalpha(uc) || c=='_' || c==':' )
        return true;

      return !firstFl && (isdigit(uc) || c=='-' || c=='.');
    }

    char* _parseName( parser_t& p )
    {
      const char* s = p.c;

      if( !_isNameChar(*p.c,true) )
        return nullptr;

      while( _isNameChar(*p.c,false) )
        _advance(p);

      return mem::duplStr(s,p.c-s);
    }

    unsigned _encodeUtf8( unsigned long cp, char* buf )
    {
      if( cp < 0x80 )
      {
        buf[0] = (char)cp;
        return 1;
      }

      if( cp < 0x800 )
      {
        buf[0] = (char)(0xc0 | (cp >> 6));
        buf[1] = (char)(0x80 | (cp & 0x3f));
        return 2;
      }

      if( cp < 0x10000 )
      {
        buf[0] = (char)(0xe0 | (cp >> 12));
        buf[1] = (char)(0x80 | ((cp >> 6) & 0x3f));
        buf[2] = (char)(0x80 | (cp & 0x3f));
        return 3;
      }

      buf[0] = (char)(0xf0 | ((cp >> 18) & 0x07));
      buf[1] = (char)(0x80 | ((cp >> 12) & 0x3f));
      buf[2] = (char)(0x80 | ((cp >> 6) & 0x3f));
      buf[3] = (char)(0x80 | (cp & 0x3f));
      return 4;
    }

    // Replace the entity references in s[sn] and return the result in a newly allocated string.
    rc_t _unescape( const parser_t& p, const char* s, unsigned sn, char*& dstRef )
    {
      // an expanded entity is never longer than it's reference
      char*    d = mem::alloc<char>(sn+1);
      unsigned j = 0;

      dstRef = nullptr;

      for(unsigned i=0; i<sn; )
      {
        if( s[i] != '&' )
        {
          d[j++] = s[i++];
          continue;
        }

        const char* semi = (const char*)memchr(s+i,';',sn-i);

        if( semi == nullptr )
        {
          mem::release(d);
          return _syntaxError(p,"Unterminated entity reference.");
        }

        const char* ent  = s + i + 1;
        unsigned    entN = semi - ent;

        if( entN > 1 && ent[0]=='#' )
        {
          char*         end = nullptr;
          bool          hexFl = ent[1]=='x' || ent[1]=='X';
          unsigned long cp    = strtoul(ent + (hexFl ? 2 : 1), &end, hexFl ? 16 : 10);

          if( end != semi || cp == 0 || cp > 0x10ffff )
          {
            mem::release(d);
            return _syntaxError(p,"Invalid character reference '&%.*s;'.",(int)entN,ent);
          }

          j += _encodeUtf8(cp,d+j);
        }
        else
        {
          const entity_t* e = _entityArray;
          for(; e->label != nullptr; ++e)
            if( strlen(e->label)==entN && strncmp(e->label,ent,entN)==0 )
              break;

          if( e->label == nullptr )
          {
            mem::release(d);
            return _syntaxError(p,"Unknown entity '&%.*s;'.",(int)entN,ent);
          }

          d[j++] = e->ch;
        }

        i = (semi - s) + 1;
      }

      d[j] = 0;
      dstRef = d;
      return kOkRC;
    }

    void _appendText( node_t* n, const char* s, unsigned sn )
    {
      unsigned n0 = textLength(n->text);
      n->text     = mem::resizeZ<char>(n->text, n0 + sn + 1);
      memcpy(n->text+n0,s,sn);
      n->text[n0+sn] = 0;
    }

    rc_t _parseAttributes( parser_t& p, node_t* n, bool& emptyFlRef )
    {
      rc_t    rc    = kOkRC;
      attr_t* lastA = nullptr;

      emptyFlRef = false;

      for(;;)
      {
        _skipWhite(p);

        if( _match(p,"/>") )
        {
          emptyFlRef = true;
          break;
        }

        if( _match(p,">") )
          break;

        char* label;
        if((label = _parseName(p)) == nullptr )
          return _syntaxError(p,"Invalid attribute name in element '%s'.",n->label);

        attr_t* a = mem::allocZ<attr_t>();
        a->label  = label;

        // attributes are kept in document order
        if( lastA == nullptr )
          n->attrL = a;
        else
          lastA->link = a;
        lastA = a;

        _skipWhite(p);
        if( !_match(p,"=") )
          return _syntaxError(p,"Missing '=' after the attribute '%s'.",label);

        _skipWhite(p);

        char q = *p.c;
        if( q != '"' && q != '\'' )
          return _syntaxError(p,"The value of attribute '%s' is not quoted.",label);

        _advance(p);

        const char* s = p.c;
        while( *p.c && *p.c != q )
          _advance(p);

        if( *p.c != q )
          return _syntaxError(p,"Unterminated value for attribute '%s'.",label);

        if((rc = _unescape(p,s,p.c-s,a->value)) != kOkRC )
          return rc;

        _advance(p);
      }

      return rc;
    }

    // Parse the element whose '<' has already been consumed.
    rc_t _parseElement( parser_t& p, node_t* parent, node_t*& nodeRef )
    {
      rc_t    rc      = kOkRC;
      bool    emptyFl = false;
      node_t* n       = mem::allocZ<node_t>();
      node_t* lastC   = nullptr;

      nodeRef   = n;
      n->parent = parent;

      if((n->label = _parseName(p)) == nullptr )
        return _syntaxError(p,"Expected an element name.");

      if((rc = _parseAttributes(p,n,emptyFl)) != kOkRC || emptyFl )
        return rc;

      // parse the element content
      for(;;)
      {
        if( *p.c == 0 )
          return _syntaxError(p,"The element '%s' is not closed.",n->label);

        if( _match(p,"<!--") )
        {
          if((rc = _skipPast(p,"-->","comment")) != kOkRC )
            return rc;
          continue;
        }

        if( _match(p,"<![CDATA[") )
        {
          const char* s = p.c;
          if((rc = _skipPast(p,"]]>","CDATA section")) != kOkRC )
            return rc;

          _appendText(n,s,(p.c - s) - 3);
          continue;
        }

        if( _match(p,"<?") )
        {
          if((rc = _skipPast(p,"?>","processing instruction")) != kOkRC )
            return rc;
          continue;
        }

        if( _match(p,"</") )
        {
          char* label;
          if((label = _parseName(p)) == nullptr || textIsNotEqual(label,n->label) )
            rc = _syntaxError(p,"Mismatched end tag '%s' for the element '%s'.",ptStringNullGuard(label),n->label);

          mem::release(label);

          if( rc != kOkRC )
            return rc;

          _skipWhite(p);
          if( !_match(p,">") )
            return _syntaxError(p,"Expected '>' to close the end tag of '%s'.",n->label);

          break;
        }

        if( _match(p,"<") )
        {
          node_t* child = nullptr;

          rc = _parseElement(p,n,child);

          // link the child even on error so that it is released with the tree
          if( lastC == nullptr )
            n->children = child;
          else
            lastC->sibling = child;
          lastC = child;

          if( rc != kOkRC )
            return rc;

          continue;
        }

        // character data
        const char* s = p.c;
        while( *p.c && *p.c != '<' )
          _advance(p);

        char* t = nullptr;
        if((rc = _unescape(p,s,p.c-s,t)) != kOkRC )
          return rc;

        _appendText(n,t,textLength(t));
        mem::release(t);
      }

      if( n->text != nullptr )
        textTrim(n->text);

      return rc;
    }

    // Skip the prolog items: XML declaration, comments, processing instructions and DOCTYPE.
    rc_t _skipMisc( parser_t& p )
    {
      rc_t rc = kOkRC;

      for(;;)
      {
        _skipWhite(p);

        if( _match(p,"<?") )
          rc = _skipPast(p,"?>","processing instruction");
        else
          if( _match(p,"<!--") )
            rc = _skipPast(p,"-->","comment");
          else
            if( _match(p,"<!DOCTYPE") )
            {
              // the DOCTYPE may contain an internal subset in [...]
              while( *p.c && *p.c != '>' && *p.c != '[' )
                _advance(p);

              if( *p.c == '[' )
                rc = _skipPast(p,"]","DOCTYPE internal subset");

              if( rc == kOkRC )
                rc = _skipPast(p,">","DOCTYPE");
            }
            else
              break;

        if( rc != kOkRC )
          break;
      }

      return rc;
    }
  }
}

void pt::xml::node_t::free()
{
  node_t* c1 = nullptr;
  for(node_t* c=children; c!=nullptr; c=c1)
  {
    c1 = c->sibling;
    c->free();
  }

  attr_t* a1 = nullptr;
  for(attr_t* a=attrL; a!=nullptr; a=a1)
  {
    a1 = a->link;
    mem::release(a->label);
    mem::release(a->value);
    mem::release(a);
  }

  mem::release(label);
  mem::release(text);

  node_t* self = this;
  mem::release(self);
}

unsigned pt::xml::node_t::child_count() const
{
  unsigned n = 0;
  for(const node_t* c=children; c!=nullptr; c=c->sibling)
    ++n;
  return n;
}

const pt::xml::node_t* pt::xml::node_t::find_child( const char* label ) const
{ return next_child(label,nullptr); }

const pt::xml::node_t* pt::xml::node_t::next_child( const char* label, const node_t* prev ) const
{
  for(const node_t* c = prev==nullptr ? children : prev->sibling; c!=nullptr; c=c->sibling)
    if( label==nullptr || textIsEqual(c->label,label) )
      return c;

  return nullptr;
}

const pt::xml::node_t* pt::xml::node_t::find_descendant( const char* label ) const
{
  for(const node_t* c=children; c!=nullptr; c=c->sibling)
  {
    if( textIsEqual(c->label,label) )
      return c;

    const node_t* d;
    if((d = c->find_descendant(label)) != nullptr )
      return d;
  }

  return nullptr;
}

const char* pt::xml::node_t::attr( const char* label ) const
{
  for(const attr_t* a=attrL; a!=nullptr; a=a->link)
    if( textIsEqual(a->label,label) )
      return a->value;

  return nullptr;
}

const char* pt::xml::node_t::trimmed_text() const
{ return text==nullptr ? "" : text; }

const char* pt::xml::node_t::child_text( const char* label ) const
{
  const node_t* c;
  if((c = find_child(label)) == nullptr )
    return nullptr;

  return c->trimmed_text();
}

pt::rc_t pt::xml::parse( const char* text, node_t*& rootRef )
{
  rc_t     rc   = kOkRC;
  node_t*  root = nullptr;
  parser_t p;

  rootRef = nullptr;

  if( textIsBlank(text) )
    return ptLogError(kInvalidArgRC,"The XML document is empty.");

  p.c      = text;
  p.lineNo = 1;

  // skip the UTF-8 byte order mark
  _match(p,"\xEF\xBB\xBF");

  if((rc = _skipMisc(p)) != kOkRC )
    goto errLabel;

  if( !_match(p,"<") )
  {
    rc = _syntaxError(p,"The document does not contain a root element.");
    goto errLabel;
  }

  if((rc = _parseElement(p,nullptr,root)) != kOkRC )
    goto errLabel;

  if((rc = _skipMisc(p)) != kOkRC )
    goto errLabel;

  if( *p.c != 0 )
  {
    rc = _syntaxError(p,"Unexpected content follows the root element.");
    goto errLabel;
  }

  rootRef = root;
  root    = nullptr;

errLabel:
  if( root != nullptr )
    root->free();

  return rc;
}

pt::rc_t pt::xml::parseFile( const char* fn, node_t*& rootRef )
{
  rc_t     rc  = kOkRC;
  char*    buf = nullptr;

  rootRef = nullptr;

  if( textLength(fn) == 0 )
    return ptLogError(kInvalidArgRC,"The XML file name is empty.");

  if((buf = file::fnToStr(fn,nullptr)) == nullptr )
    return ptLogError(kOpenFailRC,"The XML file '%s' could not be read.",fn);

  if((rc = parse(buf,rootRef)) != kOkRC )
    rc = ptLogError(rc,"XML parse failed on '%s'.",fn);

  mem::release(buf);

  return rc;
}
