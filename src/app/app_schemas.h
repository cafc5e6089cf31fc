#pragma once

#include <rapidjson/schema.h>

namespace app
{

extern rapidjson::SchemaDocument HANDLER_CATALOG_SCHEMA_DOC;

};
