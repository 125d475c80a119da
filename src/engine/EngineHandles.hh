#ifndef ENGINEHANDLES_HH
#define ENGINEHANDLES_HH

// Opaque engine handles. Only the files in this directory know these are
// libxml2 structures, the rest of the library just passes them around.
struct _xmlDoc;
struct _xmlNode;

namespace xmlscraper::engine {

using DocHandle = _xmlDoc*;
using NodeHandle = _xmlNode*;

} // namespace xmlscraper::engine

#endif
