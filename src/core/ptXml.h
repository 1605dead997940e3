//| Copyright: (C) 2020-2024 Kevin Larke <contact AT larke DOT org>
//| License: GNU GPL version 3.0 or above. See the accompanying LICENSE file.
#ifndef ptXml_H
#define ptXml_H

// Minimal XML DOM reader.
// Supports elements, attributes, character data, CDATA sections, comments,
// processing instructions, DOCTYPE declarations and the predefined and
// numeric character entities. Namespaces and DTD validation are not supported.

namespace pt
{
  namespace xml
  {
    typedef struct attr_str
    {
      char*            label;
      char*            value;
      struct attr_str* link;
    } attr_t;

    typedef struct node_str
    {
      char*            label;    // element name
      char*            text;     // concatenated character data of this element (not including descendants)
      attr_t*          attrL;    // attribute list in document order
      struct node_str* parent;
      struct node_str* children; // first child element
      struct node_str* sibling;  // next sibling element

      // Release this node and all of it's descendants.
      void free();

      unsigned child_count() const;

      // Return the first child element named 'label' or nullptr if no such child exists.
      const struct node_str* find_child( const char* label ) const;

      // Return the next sibling of 'prev' named 'label'. Set 'prev' to nullptr to
      // get the first child named 'label'. Set 'label' to nullptr to match any element.
      const struct node_str* next_child( const char* label, const struct node_str* prev ) const;

      // Return the first descendant named 'label' in document order (depth first, pre-order).
      const struct node_str* find_descendant( const char* label ) const;

      // Return the value of the attribute 'label' or nullptr if the attribute does not exist.
      const char* attr( const char* label ) const;

      // Return the character data of this element with leading and trailing
      // white space removed. Returns "" (never nullptr) if the element has no text.
      const char* trimmed_text() const;

      // Return the trimmed text of the first child element named 'label' or nullptr
      // if the child does not exist.
      const char* child_text( const char* label ) const;

    } node_t;

    // Parse 'text' into an element tree. 'rootRef' is set to the document element.
    // Returns kInvalidArgRC if 'text' is null or empty and kSyntaxErrorRC if the markup is malformed.
    // Release the returned tree with rootRef->free().
    rc_t parse( const char* text, node_t*& rootRef );

    rc_t parseFile( const char* fn, node_t*& rootRef );
  }
}

#endif
