#pragma once

#include "trellis/resources.hpp"

#include <string>
#include <vector>

namespace trellis {

// ============================================================================
// Document Ingestion
// ============================================================================
//
// A document is a JSON object:
//
//   {
//     "kind": "Proxy",
//     "metadata": {"namespace": "web", "name": "root",
//                  "creation_timestamp": "2024-01-01T00:00:00Z", "revision": 3},
//     "spec": { ... }
//   }
//
// A document that cannot be identified (no kind, unknown kind, no name)
// fails to parse. Problems inside "spec" do not fail the parse: they are
// recorded in Document::parse_errors and surface as SpecError conditions
// on the document's status.

struct DocumentParseResult {
    bool ok = false;
    std::string error;
    Document document;
};

struct DocumentsParseResult {
    bool ok = false;
    std::string error;
    std::vector<Document> documents;
};

// Parse a single document object
DocumentParseResult parse_resource_document(const std::string& json_str,
                                            const std::string& source_path = "");

// Parse either one document object or an array of them. The first
// unidentifiable document fails the whole input.
DocumentsParseResult parse_resource_documents(const std::string& json_str,
                                              const std::string& source_path = "");

} // namespace trellis
