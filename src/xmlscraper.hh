#ifndef XMLSCRAPER_HH
#define XMLSCRAPER_HH

// Tolerant HTML/XML parsing with XPath queries.
//
//   auto doc = xmlscraper::Document::parse(html);
//   for (const auto& text : doc.extractTexts("//li")) { ... }

#include "Diagnostics.hh"
#include "Document.hh"
#include "DocumentExpiredException.hh"
#include "Node.hh"
#include "NodeType.hh"
#include "ParseDiagnostic.hh"
#include "ParseError.hh"
#include "ParseOptions.hh"
#include "ScraperException.hh"
#include "StdioDiagnostics.hh"
#include "XPathError.hh"
#include "XPathResult.hh"

namespace xmlscraper {

/** Initialize the XML engine. Optional, parsing a Document does this on
  * first use. Safe to call more than once and from several threads.
  */
void init();

/** Release the global state of the XML engine. When Documents are still
  * alive this only happens when the last one is destroyed.
  */
void cleanup();

} // namespace xmlscraper

#endif
