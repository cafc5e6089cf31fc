#include "file_loading.h"

#include <ostream>
#include <fstream>
#include <string>
#include <sstream>
#include <stdexcept>

#include <rapidjson/document.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/reader.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/error/en.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace util {

rapidjson::SchemaDocument load_schema_from_cstr(const char *cstr) {
    rapidjson::Document doc;
    rapidjson::ParseResult ok = doc.Parse(cstr);
    if (!ok) {
        auto err = fmt::format("JSON schema parse error: {} ({})", 
            rapidjson::GetParseError_En(ok.Code()), ok.Offset());
        spdlog::critical(err);
        throw std::invalid_argument(err);
    }
    return rapidjson::SchemaDocument(doc);
}

bool validate_document(const rapidjson::Document &doc, rapidjson::SchemaDocument &schema_doc) {
    rapidjson::SchemaValidator validator(schema_doc);
    if (!doc.Accept(validator)) {
        spdlog::error("Doc doesn't match schema");

        rapidjson::StringBuffer sb;
        validator.GetInvalidDocumentPointer().StringifyUriFragment(sb);
        spdlog::error(fmt::format("document pointer: {}", sb.GetString()));
        spdlog::error(fmt::format("error-type: {}", validator.GetInvalidSchemaKeyword()));
        sb.Clear();

        validator.GetInvalidSchemaPointer().StringifyUriFragment(sb);
        spdlog::error(fmt::format("schema pointer: {}", sb.GetString()));
        sb.Clear();

        return false;
    }

    return true;
}

DocumentLoadResult load_document_from_file(const char *fn) {
    std::ifstream file(fn);
    if (!file.is_open()) {
        spdlog::warn(fmt::format("Unable to open file: {}", fn));
        DocumentLoadResult res;
        res.code = DocumentLoadCode::FILE_NOT_FOUND;
        return res;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    file.close();

    return load_document_from_cstr(ss.str().c_str());
}

DocumentLoadResult load_document_from_cstr(const char *cstr) {
    DocumentLoadResult res;

    rapidjson::Document doc;
    rapidjson::ParseResult ok = doc.Parse(cstr);
    if (!ok) {
        spdlog::error(fmt::format("JSON parse error: {} ({})", 
            rapidjson::GetParseError_En(ok.Code()), ok.Offset()));
        res.code = DocumentLoadCode::PARSE_ERROR;
        return res;
    }

    res.code = DocumentLoadCode::OK;
    res.doc = std::move(doc);
    return res;
}

void write_json_to_stream(const rapidjson::Document &doc, std::ostream &os) {
    rapidjson::StringBuffer sb;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(sb);
    writer.SetIndent(' ', 2);

    doc.Accept(writer);
    os << sb.GetString() << std::endl;
}

};
