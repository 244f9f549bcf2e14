#include <semq/types.hpp>

namespace semq
{

const char* to_string(StructureKind kind)
{
    return kind == StructureKind::Object ? "Object" : "Array";
}

bool operator==(const StructureNode& lhs, const StructureNode& rhs)
{
    return lhs.start == rhs.start && lhs.end == rhs.end && lhs.kind == rhs.kind &&
           lhs.children == rhs.children;
}

bool operator!=(const StructureNode& lhs, const StructureNode& rhs)
{
    return !(lhs == rhs);
}

} // namespace semq
