#include "app_schemas.h"
#include "util/file_loading.h"

namespace app
{

const char* HANDLER_CATALOG_SCHEMA = 
R"({
    "title": "handler catalog",
    "description": "Ordered list of pattern handlers used to parse release names",
    "type": "object",
    "definitions": {
        "field_value": {
            "type": ["string", "integer", "boolean"]
        }
    },
    "properties": {
        "handlers": {
            "type": "array",
            "items": {
                "type": "object",
                "properties": {
                    "name": { "type": "string", "minLength": 1 },
                    "pattern": { "type": "string", "minLength": 1 },
                    "flags": { "enum": ["", "i"] },
                    "transform": { 
                        "enum": ["none", "integer", "boolean", "lowercase", "uppercase", "range", "year_range"] 
                    },
                    "collect": { "enum": ["array", "uniq_concat"] },
                    "options": {
                        "type": "object",
                        "properties": {
                            "skip_if_already_found": { "type": "boolean" },
                            "skip_from_title": { "type": "boolean" },
                            "skip_if_first": { "type": "boolean" },
                            "skip_if_before": {
                                "type": "array",
                                "items": { "type": "string" }
                            },
                            "remove": { "type": "boolean" },
                            "value": { "$ref": "#/definitions/field_value" }
                        },
                        "additionalProperties": false
                    }
                },
                "required": ["name", "pattern"],
                "additionalProperties": false
            }
        }
    },
    "required": ["handlers"]
})";

rapidjson::SchemaDocument HANDLER_CATALOG_SCHEMA_DOC = util::load_schema_from_cstr(HANDLER_CATALOG_SCHEMA);

};
