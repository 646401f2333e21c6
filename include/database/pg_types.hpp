#pragma once

#include <cstdint>
#include <string>

namespace Roster {

/**
 * Built-in PostgreSQL type OIDs (see pg_type.dat). Only the types the
 * exporters need to tell apart are listed.
 */
namespace PgType {
inline constexpr uint32_t Bool        = 16;
inline constexpr uint32_t Char        = 18;
inline constexpr uint32_t Name        = 19;
inline constexpr uint32_t Int8        = 20;
inline constexpr uint32_t Int2        = 21;
inline constexpr uint32_t Int4        = 23;
inline constexpr uint32_t Text        = 25;
inline constexpr uint32_t Oid         = 26;
inline constexpr uint32_t Json        = 114;
inline constexpr uint32_t Xml         = 142;
inline constexpr uint32_t Float4      = 700;
inline constexpr uint32_t Float8      = 701;
inline constexpr uint32_t Unknown     = 705;
inline constexpr uint32_t Money       = 790;
inline constexpr uint32_t BpChar      = 1042;
inline constexpr uint32_t Varchar     = 1043;
inline constexpr uint32_t Date        = 1082;
inline constexpr uint32_t Time        = 1083;
inline constexpr uint32_t Timestamp   = 1114;
inline constexpr uint32_t TimestampTz = 1184;
inline constexpr uint32_t Interval    = 1186;
inline constexpr uint32_t TimeTz      = 1266;
inline constexpr uint32_t Numeric     = 1700;
inline constexpr uint32_t Uuid        = 2950;
inline constexpr uint32_t Jsonb       = 3802;
inline constexpr uint32_t Bytea       = 17;

enum class Category {
    Boolean,
    Integer,
    Float,
    Decimal,
    String,
    Json,
    Other
};

Category category(uint32_t oid);

/**
 * @brief SQL name of a type OID, e.g. "timestamp"; "oid <n>" when unknown.
 */
std::string type_name(uint32_t oid);

} // namespace PgType

} // namespace Roster
