#pragma once

// helper file for json files
// - loads a json file or string
// - load a schema file
// - validate a json document against a schema document
// - writes a json document

#include <ostream>
#include <rapidjson/document.h>
#include <rapidjson/schema.h>

namespace util
{

// load schema from a buffer
// THROWS: std::invalid_argument if the schema isn't valid json
rapidjson::SchemaDocument load_schema_from_cstr(const char *cstr);

// use validation schema and log any errors 
bool validate_document(const rapidjson::Document& doc, rapidjson::SchemaDocument& schema_doc);

// reading json documents
enum DocumentLoadCode {
    OK, FILE_NOT_FOUND, PARSE_ERROR
};
struct DocumentLoadResult {
   DocumentLoadCode code = DocumentLoadCode::PARSE_ERROR;
   rapidjson::Document doc; 
};
DocumentLoadResult load_document_from_file(const char *fn);
DocumentLoadResult load_document_from_cstr(const char *cstr);

void write_json_to_stream(const rapidjson::Document& doc, std::ostream& os);

};
