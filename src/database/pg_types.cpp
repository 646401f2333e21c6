#include <database/pg_types.hpp>
#include <unordered_map>

namespace Roster {
namespace PgType {

Category category(uint32_t oid) {
    switch (oid) {
        case Bool:
            return Category::Boolean;
        case Int2:
        case Int4:
        case Int8:
        case Oid:
            return Category::Integer;
        case Float4:
        case Float8:
            return Category::Float;
        case Numeric:
            return Category::Decimal;
        case Char:
        case Name:
        case Text:
        case BpChar:
        case Varchar:
        case Unknown:
            return Category::String;
        case Json:
        case Jsonb:
            return Category::Json;
        default:
            return Category::Other;
    }
}

std::string type_name(uint32_t oid) {
    static const std::unordered_map<uint32_t, std::string> NAMES = {
        {Bool, "boolean"},       {Char, "char"},
        {Name, "name"},          {Int8, "bigint"},
        {Int2, "smallint"},      {Int4, "integer"},
        {Text, "text"},          {Oid, "oid"},
        {Json, "json"},          {Xml, "xml"},
        {Float4, "real"},        {Float8, "double precision"},
        {Unknown, "unknown"},    {Money, "money"},
        {BpChar, "character"},   {Varchar, "character varying"},
        {Date, "date"},          {Time, "time"},
        {Timestamp, "timestamp"}, {TimestampTz, "timestamptz"},
        {Interval, "interval"},  {TimeTz, "timetz"},
        {Numeric, "numeric"},    {Uuid, "uuid"},
        {Jsonb, "jsonb"},        {Bytea, "bytea"},
    };

    auto it = NAMES.find(oid);
    if (it != NAMES.end()) return it->second;
    return "oid " + std::to_string(oid);
}

} // namespace PgType
} // namespace Roster
